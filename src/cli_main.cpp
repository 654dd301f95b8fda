#include <cxxopts.hpp>
#include <iostream>
#include "cfgbind/ConfigTree.hpp"
#include "cfgbind/Emptiness.hpp"
#include "cfgbind/Errors.hpp"
#include "cfgbind/FieldPolicy.hpp"
#include "cfgbind/Inspect.hpp"
#include "cfgbind/Loader.hpp"

using namespace cfgbind;

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("cfgbind", "Inspect raw config values and field skip/default decisions");
        options.positional_help("COMMAND KEY");

        options.add_options()
            ("c,config", "Path to JSON/TOML config", cxxopts::value<std::string>())
            ("skip-if", "Comma-separated skip conditions: missing,null,empty", cxxopts::value<std::string>()->default_value(""))
            ("default", "Default value (JSON, or a plain string)", cxxopts::value<std::string>())
            ("default-when", "Comma-separated default triggers: missing,null,empty", cxxopts::value<std::string>()->default_value("missing"))
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: raw KEY | empty KEY | decide KEY [--skip-if LIST] [--default JSON] [--default-when LIST] | dump\n";
            return 0;
        }

        if (!result.count("config")) {
            std::cerr << "Error: --config must be provided\n";
            return 1;
        }
        ConfigTree tree = load_tree(result["config"].as<std::string>());

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        if (cmd == "dump") {
            std::cout << tree.to_json_string(2) << "\n";
            return 0;
        }

        if (cmdv.size() < 2) {
            std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
            return 1;
        }
        const std::string key = cmdv[1];
        const RawValue raw = tree.get_raw(key);

        if (cmd == "raw") {
            std::cout << format_raw(raw) << "\n";
            return 0;
        }

        if (cmd == "empty") {
            std::cout << (is_empty(raw) ? "true" : "false") << "\n";
            return 0;
        }

        if (cmd == "decide") {
            FieldRuleSpec rule;
            rule.key = key;
            rule.skip_if = result["skip-if"].as<std::string>();
            if (result.count("default")) {
                rule.default_value = result["default"].as<std::string>();
            }
            rule.default_when = result["default-when"].as<std::string>();
            FieldMetadata field = make_field_metadata(rule);

            PredicateResolver resolver;
            FieldPolicyEngine policy(resolver);
            Decision decision = policy.decide(field, raw, ObjectRef());

            std::cout << format_decision(decision) << "\n";
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;
    } catch (const ConfigError& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
