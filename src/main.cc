#include "cli/cli.h"
#include "cli/error.h"
#include <iostream>
#include <string>

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_help(argv[0]);
        return 1;
    }

    // Color must be settled before anything prints
    for (int i = 1; i < argc; ++i)
    {
        if (std::string(argv[i]) == "--no-color")
            colors::enabled = false;
    }

    std::string first_arg = argv[1];

    if (first_arg == "help" || first_arg == "--help" || first_arg == "-h")
    {
        print_help(argv[0]);
        return 0;
    }

    if (first_arg != "check" && first_arg != "render" && first_arg != "diff")
    {
        ErrorHandler::cli_error("unknown command: " + first_arg, "Run " + std::string(argv[0]) + " --help for usage");
        return 1;
    }

    CliOptions options;
    options.command = first_arg;

    for (int i = 2; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto value_of = [&](std::string &out) -> bool
        {
            if (i + 1 < argc)
            {
                out = argv[++i];
                return true;
            }
            ErrorHandler::cli_error(arg + " requires an argument");
            return false;
        };

        if (arg == "--no-color")
            continue;
        else if (arg == "--json")
            options.json = true;
        else if (arg == "--assigns")
        {
            if (!value_of(options.assigns_path))
                return 1;
        }
        else if (arg == "--before")
        {
            if (!value_of(options.before_path))
                return 1;
        }
        else if (arg == "--after")
        {
            if (!value_of(options.after_path))
                return 1;
        }
        else if (arg == "--components")
        {
            if (!value_of(options.components_dir))
                return 1;
        }
        else if (arg == "--file-name")
        {
            if (!value_of(options.file_name))
                return 1;
        }
        else if (options.template_path.empty() && arg.rfind("--", 0) != 0)
            options.template_path = arg;
        else
        {
            ErrorHandler::cli_error("unknown argument or multiple templates: " + arg);
            return 1;
        }
    }

    if (options.template_path.empty())
    {
        ErrorHandler::cli_error("no template specified", "Example: " + std::string(argv[0]) + " " + first_arg + " page.heex");
        return 1;
    }

    try
    {
        if (options.command == "check")
            return check_command(options);
        if (options.command == "render")
            return render_command(options);
        return diff_command(options);
    }
    catch (const ParseError &e)
    {
        std::cerr << colors::paint(colors::RED) << "Error:" << colors::paint(colors::RESET) << " " << e.what()
                  << colors::paint(colors::DIM) << " (" << error_kind_name(e.kind) << ")" << colors::paint(colors::RESET) << std::endl;
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << colors::paint(colors::RED) << "Error:" << colors::paint(colors::RESET) << " " << e.what() << std::endl;
        return 1;
    }
}
