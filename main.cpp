#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>

#include "application/TranslationService.hpp"
#include "infrastructure/BaselineCache.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/HttpFetcher.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace langlens;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitNotFound = 1;
constexpr int kExitUsage = 2;

struct CliOptions {
    std::string configPath;
    std::optional<std::string> locale;
    std::vector<std::string> workspaceRoots;
    std::vector<std::string> packPaths;
    bool noVanilla = false;
    std::string command;
    std::vector<std::string> args;
};

void PrintUsage() {
    std::cerr <<
        "Usage: langlens [options] <command> [args]\n"
        "\n"
        "Options:\n"
        "  --config FILE      settings.json to read (default: XDG config dir)\n"
        "  --workspace DIR    workspace root to scan for a resource pack (repeatable)\n"
        "  --pack DIR         extra resource pack path (repeatable)\n"
        "  --locale CODE      locale to resolve (default: defaultLanguage)\n"
        "  --no-vanilla       do not load the remote baseline\n"
        "\n"
        "Commands:\n"
        "  lookup KEY            print the value and where it was defined\n"
        "  search QUERY [LIMIT]  case-insensitive search over keys and values\n"
        "  locales               list available locale codes\n"
        "  packs                 list discovered resource packs\n"
        "  dump                  print every resolved key=value\n"
        "  clear-cache [LOCALE]  drop cached baseline data and reload\n"
        "  set-language CODE     store CODE as defaultLanguage in the settings file\n";
}

std::optional<CliOptions> ParseArgs(int argc, char** argv) {
    CliOptions opts;
    opts.configPath = infrastructure::PathUtils::GetDefaultConfigPath().string();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto takeValue = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--config") {
            if (!takeValue(opts.configPath)) return std::nullopt;
        } else if (arg == "--locale") {
            std::string value;
            if (!takeValue(value)) return std::nullopt;
            opts.locale = value;
        } else if (arg == "--workspace") {
            std::string value;
            if (!takeValue(value)) return std::nullopt;
            opts.workspaceRoots.push_back(value);
        } else if (arg == "--pack") {
            std::string value;
            if (!takeValue(value)) return std::nullopt;
            opts.packPaths.push_back(value);
        } else if (arg == "--no-vanilla") {
            opts.noVanilla = true;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }

    if (opts.command.empty()) {
        return std::nullopt;
    }
    return opts;
}

std::optional<int> ParseLimit(const std::string& text) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) return std::nullopt;
        return value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

void PrintEntry(const domain::TranslationEntry& entry) {
    std::cout << entry.key << "=" << entry.value
              << "    (" << entry.sourceLocation << ":" << entry.lineNumber << ")" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    auto parsed = ParseArgs(argc, argv);
    if (!parsed) {
        PrintUsage();
        return kExitUsage;
    }
    const CliOptions& opts = *parsed;

    if (opts.command == "set-language") {
        if (opts.args.size() != 1) {
            PrintUsage();
            return kExitUsage;
        }
        if (!infrastructure::ConfigLoader::SaveDefaultLanguage(opts.configPath, opts.args[0])) {
            return kExitNotFound;
        }
        std::cout << "defaultLanguage set to " << opts.args[0] << " in " << opts.configPath << std::endl;
        return kExitOk;
    }

    infrastructure::EngineSettings settings = infrastructure::ConfigLoader::Load(opts.configPath);

    std::string cacheDir = settings.cacheDirectory.empty()
        ? infrastructure::PathUtils::GetDefaultBaselineCacheDir().string()
        : infrastructure::PathUtils::ExpandHome(settings.cacheDirectory);
    std::string urlTemplate = settings.vanillaUrlTemplate.empty()
        ? std::string(infrastructure::BaselineCache::kDefaultUrlTemplate)
        : settings.vanillaUrlTemplate;

    auto fetcher = std::make_shared<infrastructure::HttpFetcher>(settings.fetchTimeoutSeconds);
    auto baseline = std::make_shared<infrastructure::BaselineCache>(cacheDir, fetcher, urlTemplate);
    baseline->setEnabled(settings.useVanillaTranslations && !opts.noVanilla);

    std::vector<std::string> workspaceRoots = settings.workspaceRoots;
    workspaceRoots.insert(workspaceRoots.end(), opts.workspaceRoots.begin(), opts.workspaceRoots.end());
    std::vector<std::string> configuredRoots = settings.resourcePackPaths;
    configuredRoots.insert(configuredRoots.end(), opts.packPaths.begin(), opts.packPaths.end());

    application::TranslationService service(baseline, opts.locale.value_or(settings.defaultLanguage));
    service.setRoots(workspaceRoots, configuredRoots);

    if (opts.command == "clear-cache") {
        std::optional<std::string> locale;
        if (!opts.args.empty()) locale = opts.args[0];
        service.clearBaselineCache(locale);
        std::cout << "Baseline cache cleared; " << service.getAllTranslations().size()
                  << " translations loaded for " << service.getCurrentLocale() << std::endl;
        return kExitOk;
    }

    int limit = 50;
    if (opts.command == "search") {
        if (opts.args.empty() || opts.args.size() > 2) {
            PrintUsage();
            return kExitUsage;
        }
        if (opts.args.size() == 2) {
            auto parsedLimit = ParseLimit(opts.args[1]);
            if (!parsedLimit) {
                std::cerr << "Invalid LIMIT: " << opts.args[1] << std::endl;
                PrintUsage();
                return kExitUsage;
            }
            limit = *parsedLimit;
        }
    }

    service.refresh();

    if (opts.command == "lookup") {
        if (opts.args.size() != 1) {
            PrintUsage();
            return kExitUsage;
        }
        auto entry = service.lookup(opts.args[0]);
        if (!entry) {
            std::cerr << "No translation for " << opts.args[0] << " in " << service.getCurrentLocale() << std::endl;
            return kExitNotFound;
        }
        PrintEntry(*entry);
    } else if (opts.command == "search") {
        for (const auto& entry : service.search(opts.args[0], limit)) {
            PrintEntry(entry);
        }
    } else if (opts.command == "locales") {
        const std::string current = service.getCurrentLocale();
        for (const auto& locale : service.getAvailableLocales()) {
            std::cout << (locale == current ? "* " : "  ") << locale << std::endl;
        }
    } else if (opts.command == "packs") {
        for (const auto& pack : service.getSources()) {
            std::cout << pack.displayName << "\t" << pack.rootPath
                      << (pack.hasOverrideData ? "" : "\t(no texts/)") << std::endl;
        }
    } else if (opts.command == "dump") {
        auto current = service.snapshot();
        for (const auto& key : current->sortedKeys) {
            const auto& entry = current->table.at(key);
            std::cout << entry.key << "=" << entry.value << std::endl;
        }
    } else {
        std::cerr << "Unknown command: " << opts.command << std::endl;
        PrintUsage();
        return kExitUsage;
    }

    return kExitOk;
}
