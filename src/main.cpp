// main.cpp - Main entry point
#include <getopt.h>
#include <cstdlib>
#include <iostream>
#include "conf/config.hpp"
#include "core/catalog.hpp"
#include "core/linker.hpp"
#include "core/orchestrator.hpp"
#include "defs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace saveli;

struct CliOptions {
    std::string config_file;
    std::string command;
    bool verbose = false;
    bool dry_run = false;
    std::vector<std::string> args;
};

static void print_help() {
    std::cout << "Usage: saveli [OPTIONS] <command> [args...]\n\n";
    std::cout << "Moves game saves to a storage path and creates links in their place.\n\n";
    std::cout << "Commands:\n";
    std::cout << "  set-storage-path <path>   Set where game saves and meta data are stored\n";
    std::cout << "  link [--dry-run]          Move saves to the storage path and link them\n";
    std::cout << "  restore [--dry-run]       Create links to saves already in the storage path\n";
    std::cout << "  unlink [--dry-run]        The inverse of link\n";
    std::cout << "  search <keyword>          Search the catalog by id or title\n";
    std::cout << "  add <title> <id> <path>   Add a custom catalog entry\n";
    std::cout << "  ignore <id>               Skip a game in link, restore and unlink\n";
    std::cout << "  heed <id>                 Stop ignoring a game\n\n";

    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE       Settings file path\n";
    std::cout << "  -n, --dry-run           Log what would happen without touching files\n";
    std::cout << "  -v, --verbose           Verbose logging\n";
    std::cout << "  -V, --version           Show version\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  saveli set-storage-path ~/Dropbox/saves\n";
    std::cout << "  saveli link --dry-run\n";
    std::cout << "  saveli add \"My Game\" mygame '$HOME/.local/share/MyGame/saves'\n";
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"config", required_argument, 0, 'c'},
                                           {"dry-run", no_argument, 0, 'n'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"version", no_argument, 0, 'V'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:nvVh", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'c':
            opts.config_file = optarg;
            break;
        case 'n':
            opts.dry_run = true;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'V':
            std::cout << "saveli " << SAVELI_VERSION << "\n";
            exit(0);
        case 'h':
            print_help();
            exit(0);
        default:
            print_help();
            exit(1);
        }
    }

    if (optind < argc) {
        opts.command = argv[optind];
        optind++;
        while (optind < argc) {
            opts.args.push_back(argv[optind]);
            optind++;
        }
    }

    return opts;
}

static fs::path settings_path(const CliOptions& opts) {
    return opts.config_file.empty() ? Settings::default_path() : fs::path(opts.config_file);
}

static Settings load_settings(const CliOptions& opts) {
    if (!opts.config_file.empty()) {
        if (!fs::exists(opts.config_file)) {
            return Settings();
        }
        return Settings::from_file(opts.config_file);
    }
    return Settings::load_default();
}

static bool save_settings(const CliOptions& opts, const Settings& settings) {
    fs::path path = settings_path(opts);
    if (!settings.save_to_file(path)) {
        LOG_ERROR("Failed to save settings to " + path.string());
        return false;
    }
    return true;
}

static int set_storage_path(const CliOptions& opts, Settings& settings, const std::string& arg) {
    if (trim(arg).empty()) {
        std::cerr << "You must specify a path\n";
        return 1;
    }

    fs::path path(arg);
    if (path.is_relative()) {
        path = fs::current_path() / path;
    }
    path = path.lexically_normal();

    if (!ensure_dir_exists(path)) {
        return 1;
    }

    settings.storage_path = path;
    if (!save_settings(opts, settings)) {
        return 1;
    }

    std::cout << "Your storage path has been set to " << path.string() << "\n";
    return 0;
}

static std::string save_id_for(const std::string& tmpl) {
    std::string trimmed = trim(tmpl);
    while (!trimmed.empty() && (trimmed.back() == '/' || trimmed.back() == '\\')) {
        trimmed.pop_back();
    }
    auto pos = trimmed.find_last_of("/\\");
    std::string name = pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
    if (name.empty() || name[0] == '$') {
        return DEFAULT_SAVE_ID;
    }
    return name;
}

static int add_entry(Catalog& catalog, const std::vector<std::string>& args) {
    if (args.size() < 3) {
        std::cerr << "Usage: saveli add <title> <id> <path>\n";
        return 1;
    }

    Entry entry;
    entry.title = trim(args[0]);
    entry.id = trim(args[1]);
    entry.custom = true;

    if (entry.title.empty() || entry.id.empty() || trim(args[2]).empty()) {
        std::cerr << "The title, id and path must not be empty\n";
        return 1;
    }

    SavePath save;
    save.id = save_id_for(args[2]);
    save.raw = args[2];
    if (auto err = save.resolve()) {
        std::cerr << err->message() << "\n";
        return 1;
    }
    entry.saves.push_back(save);

    if (!catalog.add(entry)) {
        return 1;
    }

    std::cout << "Added " << entry.title << " (" << entry.id << ") with save "
              << save.id << " at " << save.resolved.string() << "\n";
    return 0;
}

static void print_report(const std::string& verb, const BatchReport& report) {
    for (const auto& outcome : report.outcomes) {
        if (outcome.status != EntryStatus::Failed) {
            continue;
        }
        std::cout << "  " << outcome.title << " (" << outcome.id << "):\n";
        for (const auto& err : outcome.errors) {
            std::cout << "    [" << link_error_kind_name(err.kind) << "] " << err.message() << "\n";
        }
    }
    std::cout << verb << " " << report.count(EntryStatus::Done) << " games, "
              << report.count(EntryStatus::Failed) << " failed, "
              << report.count(EntryStatus::Ignored) << " ignored\n";
}

int main(int argc, char* argv[]) {
    try {
        CliOptions cli = parse_args(argc, argv);

        Settings settings = load_settings(cli);
        settings.merge_with_cli(cli.verbose, cli.dry_run);

        // Initialize logger globally for all commands
        Logger::getInstance().init(settings.verbose, settings.log_file);

        if (cli.command.empty()) {
            print_help();
            return 0;
        }

        enum class Command { SET_STORAGE_PATH, LINK, RESTORE, UNLINK, SEARCH, ADD, IGNORE, HEED, UNKNOWN };

        auto get_command = [](const std::string& cmd) -> Command {
            if (cmd == "set-storage-path")
                return Command::SET_STORAGE_PATH;
            if (cmd == "link")
                return Command::LINK;
            if (cmd == "restore")
                return Command::RESTORE;
            if (cmd == "unlink")
                return Command::UNLINK;
            if (cmd == "search")
                return Command::SEARCH;
            if (cmd == "add")
                return Command::ADD;
            if (cmd == "ignore")
                return Command::IGNORE;
            if (cmd == "heed")
                return Command::HEED;
            return Command::UNKNOWN;
        };

        Command command = get_command(cli.command);

        // Commands that only touch the settings file
        switch (command) {
        case Command::UNKNOWN:
            std::cerr << "Unknown command: " << cli.command << "\n\n";
            print_help();
            return 1;

        case Command::SET_STORAGE_PATH:
            if (cli.args.empty()) {
                std::cerr << "Usage: saveli set-storage-path <path>\n";
                return 1;
            }
            return set_storage_path(cli, settings, cli.args[0]);

        case Command::IGNORE:
        case Command::HEED: {
            std::string id = cli.args.empty() ? "" : trim(cli.args[0]);
            if (id.empty()) {
                std::cerr << "The id must not be empty\n";
                return 1;
            }
            if (id.find(',') != std::string::npos) {
                std::cerr << "The id must not contain ','\n";
                return 1;
            }
            bool changed = command == Command::IGNORE ? settings.ignore(id) : settings.heed(id);
            if (!changed) {
                std::cout << id << (command == Command::IGNORE ? " is already ignored\n" : " is not ignored\n");
                return 0;
            }
            if (!save_settings(cli, settings)) {
                return 1;
            }
            std::cout << (command == Command::IGNORE ? "Ignoring " : "No longer ignoring ") << id << "\n";
            return 0;
        }

        default:
            break;
        }

        if (settings.storage_path.empty()) {
            LOG_ERROR("No storage path is configured, run 'saveli set-storage-path <path>' first");
            return 1;
        }
        if (!settings.storage_path.is_absolute()) {
            LOG_ERROR("The configured storage path isn't absolute (" + settings.storage_path.string() + ")");
            return 1;
        }

        Catalog catalog = Catalog::open(settings.storage_path);

        switch (command) {
        case Command::SEARCH: {
            std::string keyword = cli.args.empty() ? "" : cli.args[0];
            if (keyword.empty()) {
                std::cerr << "The keyword must not be empty\n";
                return 1;
            }
            auto matches = catalog.search(keyword);
            if (matches.empty()) {
                std::cout << "Couldn't find any matching games\n";
            }
            for (const Entry* entry : matches) {
                std::cout << "Found " << entry->title << " (" << entry->id << ")"
                          << (entry->custom ? " [custom]" : "") << "\n";
            }
            return 0;
        }

        case Command::ADD:
            return add_entry(catalog, cli.args);

        case Command::LINK:
        case Command::RESTORE:
        case Command::UNLINK: {
            if (!settings.dry_run) {
                if (auto err = verify_link_capability()) {
                    LOG_ERROR(err->message());
                    LOG_ERROR("Unable to create links, run saveli with sufficient privileges");
                    return 1;
                }
            } else {
                LOG_INFO("Dry run, no files will be changed");
            }

            BatchOptions opts;
            opts.storage_root = settings.storage_path;
            opts.dry_run = settings.dry_run;
            opts.is_ignored = [&settings](const std::string& id) { return settings.is_ignored(id); };

            if (command == Command::LINK) {
                print_report("Linked", link_all(catalog.entries(), opts));
            } else if (command == Command::RESTORE) {
                print_report("Restored", restore_all(catalog.entries(), opts));
            } else {
                print_report("Unlinked", unlink_all(catalog.entries(), opts));
            }
            return 0;
        }

        default:
            break;
        }
    } catch (const CatalogError& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        LOG_ERROR("Catalog error: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        LOG_ERROR("Fatal Error: " + std::string(e.what()));
        return 1;
    }
    return 0;
}
