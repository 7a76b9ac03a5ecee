#include "language/language.hpp"
#include "logger/spdlog_init.hpp"
#include "setting/exceptions.hpp"
#include "setting/setting.hpp"
#include "setting/typed_converter.hpp"
#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include <fmt/core.h>
#include <iostream>
#include <spdlog/spdlog.h>
#include <string>
#include <unistd.h>
#include <vector>

using namespace std;
using namespace cfgval;

static void print_help()
{
    cout << "\ncfgval\n\n"
            "Usage: cfgval [options] -t type key=value\n\n"
            "Options:\n"
            "  -h    This message\n"
            "  -t    Conversion: str, list, dict, bool, int, float, url, path, glob,\n"
            "        path_list, glob_list, int_list, language\n"
            "  -o    Origin file of the value (end with / for a directory)\n"
            "  -L    Line number of the value in the origin file\n"
            "  -d    List delimiters, every character is one delimiter (default \",;\")\n"
            "  -a    Mark the value as a fragment to be appended to a default\n"
            "  -l    Log level: trace, debug, info, warning, error, critical (default warning)\n"
         << endl;
}


static void print_lines(const vector<string> &lines)
{
    for (const auto &line: lines)
        cout << line << '\n';
}


static void convert(const Setting &setting, const string &type)
{
    if (type == "str") {
        cout << setting.value() << '\n';
    } else if (type == "list") {
        print_lines(setting.toList());
    } else if (type == "dict") {
        for (const auto &[key, value]: setting.toDict())
            cout << key << ": " << value << '\n';
    } else if (type == "bool") {
        cout << (setting.toBool() ? "true" : "false") << '\n';
    } else if (type == "int") {
        cout << setting.toInt() << '\n';
    } else if (type == "float") {
        cout << setting.toFloat() << '\n';
    } else if (type == "url") {
        cout << setting.toUrl() << '\n';
    } else if (type == "path") {
        cout << setting.toPath() << '\n';
    } else if (type == "glob") {
        cout << setting.toGlob() << '\n';
    } else if (type == "path_list") {
        print_lines(setting.toPathList());
    } else if (type == "glob_list") {
        print_lines(setting.toGlobList());
    } else if (type == "int_list") {
        for (const auto value: intList(setting))
            cout << value << '\n';
    } else if (type == "language") {
        for (const auto &lang: languageList(setting))
            cout << lang.toString() << '\n';
    } else {
        throw invalid_argument(fmt::format(R"(Unknown conversion "{}")", type));
    }
}


int main(int argc, char *argv[])
{
    int ch = 0;
    string type;
    string origin;
    string log_level = "warning";
    string delimiters;
    int line = 0;
    bool to_append = false;

    if (argc == 1) {
        print_help();
        return EXIT_FAILURE;
    }

    try {
        while ((ch = getopt(argc, argv, "ht:o:L:d:al:")) != -1) {
            switch (ch) {
            case 't':
                type = optarg;
                break;
            case 'o':
                origin = optarg;
                break;
            case 'L':
                line = boost::lexical_cast<int>(optarg);
                break;
            case 'd':
                delimiters = optarg;
                break;
            case 'a':
                to_append = true;
                break;
            case 'l':
                log_level = optarg;
                break;
            case 'h':
            case '?':
            default:
                print_help();
                return EXIT_FAILURE;
            }
        }
    } catch (const boost::bad_lexical_cast &) {
        cerr << "Line number must be an integer" << endl;
        return EXIT_FAILURE;
    }

    if (type.empty() || optind != argc - 1) {
        print_help();
        return EXIT_FAILURE;
    }

    try {
        logging::init_spdlog(log_level);

        const string arg = argv[optind];
        const auto eq = arg.find('=');
        if (eq == string::npos)
            throw invalid_argument(fmt::format(R"(Expected key=value, got "{}")", arg));

        FormatOptions format;
        if (!delimiters.empty()) {
            format.listDelimiters.clear();
            for (char c: delimiters)
                format.listDelimiters.emplace_back(1, c);
        }

        Origin setting_origin = origin;
        if (line > 0)
            setting_origin = SourcePosition{origin, line};

        Setting setting(arg.substr(0, eq), arg.substr(eq + 1), setting_origin, format, true, to_append);
        spdlog::debug("Converting {} to {}", setting.describe(), type);

        convert(setting, type);
    } catch (const SettingError &e) {
        spdlog::error("{}", e.what());
        return EXIT_FAILURE;
    } catch (const exception &e) {
        spdlog::critical("{}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
