// SPDX-License-Identifier: Apache-2.0
#include <args/args.hxx>
#include <cstdlib>
#include <iostream>

#include "framescan/cli/commands.hpp"
#include "framescan/global_store/global_store.hpp"
#include "framescan/utility/logging.hpp"

using namespace framescan;
using namespace framescan::utility;

struct CLIArguments {
    args::ArgumentParser parser = {
        "framescan. v" PROJECT_VERSION,
        "Infers the numbering template of data files, groups them into imagesets and "
        "expands a single frame into every file of its sequence."};
    args::HelpFlag help = {parser, "help", "Display this help menu", {'h', "help"}};

    args::PositionalList<std::string> paths = {parser, "PATH", "Files or filenames"};

    args::Group mode = {parser, "Mode", args::Group::Validators::AtMostOne};
    args::Flag group = {mode, "group", "Group filenames into imagesets (default)", {'g', "group"}};
    args::Flag expand = {
        mode, "expand", "List every file on disk in the sequence of each PATH", {'x', "expand"}};
    args::Flag show_template = {
        mode, "template", "Show the template and index of each PATH", {'t', "template"}};

    args::Group output = {parser, "Output options"};
    args::Flag json    = {output, "json", "Write JSON instead of text", {'j', "json"}};
    args::ValueFlag<char> placeholder = {
        output, "CHAR", "Placeholder for frame digits", {"placeholder"}};

    args::Group misc = {parser, "Other options"};
    args::ValueFlagList<std::string> cli_pref_paths = {
        misc, "PATH", "Path to preferences", {"pref"}};
    args::ValueFlagList<std::string> cli_override_pref_paths = {
        misc, "PATH", "Path to preferences that override defaults", {"override-pref"}};
    args::Flag debug                     = {misc, "debug", "Debugging mode", {"debug"}};
    args::ValueFlag<std::string> logfile = {misc, "PATH", "Write log to file", {"log-file"}};

    void parse_args(int argc, char **argv) {
        try {
            parser.ParseCLI(argc, argv);
        } catch (const args::Help &) {
            std::cout << parser;
            std::exit(EXIT_SUCCESS);
        } catch (const args::Error &e) {
            std::cerr << e.what() << std::endl;
            std::cerr << parser;
            std::exit(EXIT_FAILURE);
        }
    }
};

struct Launcher {

    Launcher(int argc, char **argv) {
        cli_args.parse_args(argc, argv);

        start_logger(
            cli_args.debug.Matched() ? spdlog::level::debug : spdlog::level::info,
            args::get(cli_args.logfile));

        settings = global_store::sequence_settings(load_preferences());

        if (not cli_args.debug.Matched())
            set_log_level(settings.log_level_);

        if (cli_args.placeholder)
            cli::set_placeholder(settings, args::get(cli_args.placeholder));
        if (cli_args.json)
            settings.output_format_ = "json";
    }

    ~Launcher() { stop_logger(); }

    global_store::Preferences load_preferences() {
        std::vector<std::string> pref_paths{PREFERENCE_DIR};
        for (const auto &p : args::get(cli_args.cli_pref_paths))
            pref_paths.push_back(p);

        return global_store::load_preferences(
            pref_paths, args::get(cli_args.cli_override_pref_paths));
    }

    int run() {
        auto mode = cli::Mode::GROUP;
        if (cli_args.expand)
            mode = cli::Mode::EXPAND;
        else if (cli_args.show_template)
            mode = cli::Mode::TEMPLATE;

        return cli::run(mode, args::get(cli_args.paths), settings, std::cout);
    }

    CLIArguments cli_args;
    global_store::SequenceSettings settings;
};

int main(int argc, char **argv) {
    try {
        Launcher launcher(argc, argv);
        return launcher.run();
    } catch (const std::exception &err) {
        spdlog::error("{}", err.what());
    }
    return EXIT_FAILURE;
}
