#include <atomic>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "application/TranslationService.hpp"
#include "domain/BaselineProvider.hpp"
#include "domain/LangParser.hpp"

using namespace langlens;
using langlens::application::TranslationService;
namespace fs = std::filesystem;

// In-memory baseline keyed by locale.
class FakeBaseline : public domain::BaselineProvider {
public:
    domain::TranslationTable loadTranslations(const std::string& locale) override {
        ++loads;
        if (!enabled) return {};
        if (throwOnLoad) throw std::runtime_error("baseline exploded");
        auto it = content.find(locale);
        if (it == content.end()) return {};
        return domain::LangParser::Parse(it->second, "vanilla:" + locale);
    }
    std::vector<std::string> getAvailableLanguages() const override { return {"en_US", "zh_CN"}; }
    void clearCache(const std::optional<std::string>& locale) override { cleared.push_back(locale.value_or("*")); }
    bool isEnabled() const override { return enabled; }
    void setEnabled(bool value) override { enabled = value; }

    std::map<std::string, std::string> content;
    std::vector<std::string> cleared;
    std::atomic<int> loads{0};
    bool enabled = true;
    bool throwOnLoad = false;
};

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
}

void MakePack(const fs::path& root, const std::string& name) {
    WriteFile(root / "manifest.json",
              R"({"header":{"name":")" + name + R"("},"modules":[{"type":"resources"}]})");
}

} // namespace

int main() {
    std::cout << "[Test] Starting TranslationService Test..." << std::endl;

    fs::path testRoot = fs::temp_directory_path() / "langlens_service_test";
    fs::remove_all(testRoot);

    fs::path packA = testRoot / "pack_a";
    fs::path packB = testRoot / "pack_b";
    fs::path noTexts = testRoot / "pack_no_texts";
    fs::path broken = testRoot / "pack_broken";
    MakePack(packA, "A");
    MakePack(packB, "B");
    MakePack(noTexts, "NoTexts");
    WriteFile(broken / "manifest.json", "{{{");
    WriteFile(broken / "texts" / "en_US.lang", "k=broken\n");

    WriteFile(packA / "texts" / "en_US.lang", "k=A\nj=A\n");
    WriteFile(packA / "texts" / "fr_FR.lang", "k=A-fr\n");
    WriteFile(packB / "texts" / "en_US.lang", "## B overrides\nk=B\n");
    WriteFile(packB / "texts" / "pt_BR.lang", "");

    auto baseline = std::make_shared<FakeBaseline>();
    baseline->content["en_US"] = "k=base\nbase.only=Base\n";
    baseline->content["fr_FR"] = "k=base-fr\n";

    TranslationService service(baseline);
    const std::vector<std::string> roots = {
        packA.string(), noTexts.string(), broken.string(), packB.string()
    };

    std::atomic<int> notifications{0};
    std::uint64_t lastSeenVersion = 0;
    auto listenerId = service.subscribe([&]() {
        // The new table is already published when listeners run.
        std::uint64_t v = service.version();
        assert(v > lastSeenVersion);
        lastSeenVersion = v;
        ++notifications;
    });

    // Nothing published yet.
    assert(service.version() == 0);
    assert(!service.lookup("k"));

    // Baseline, then A, then B.
    {
        auto table = service.refresh("en_US", true, roots, {});
        assert(table.at("k").value == "B");
        assert(table.at("j").value == "A");
        assert(table.at("base.only").value == "Base");
        assert(table.size() == 3);

        auto k = service.lookup("k");
        assert(k && k->value == "B");
        assert(k->sourceLocation == (packB / "texts" / "en_US.lang").string());
        assert(k->lineNumber == 2);
        assert(service.lookupValue("base.only").value() == "Base");
        assert(!service.exists("missing"));
        assert(!service.lookupValue("missing"));
        assert(notifications == 1);
        assert(service.version() == 1);

        auto sources = service.getSources();
        assert(sources.size() == 3);
        assert(sources[0].displayName == "A");
        assert(sources[1].displayName == "NoTexts");
        assert(!sources[1].hasOverrideData);
        assert(sources[2].displayName == "B");

        auto locales = service.getAvailableLocales();
        std::vector<std::string> expected = {"en_US", "fr_FR", "pt_BR", "zh_CN"};
        assert(locales == expected);
    }

    // Baseline switched off by the caller: the provider is not even asked.
    {
        int loadsBefore = baseline->loads;
        auto table = service.refresh("en_US", false, roots, {});
        assert(table.count("base.only") == 0);
        assert(table.at("k").value == "B");
        assert(baseline->loads == loadsBefore);
        assert(notifications == 2);
    }

    // setLocale refreshes before returning, using the stored roots.
    {
        service.setLocale("fr_FR");
        assert(service.getCurrentLocale() == "fr_FR");
        assert(service.lookupValue("k").value() == "A-fr");
        assert(!service.exists("j"));
        assert(notifications == 3);
    }

    // A failing baseline only loses its own contribution.
    {
        baseline->throwOnLoad = true;
        service.setLocale("en_US");
        assert(service.lookupValue("k").value() == "B");
        assert(!service.exists("base.only"));
        baseline->throwOnLoad = false;
    }

    // Configured roots come after workspace roots and override them.
    {
        auto table = service.refresh("en_US", true, {packB.string()}, {packA.string(), packB.string()});
        assert(table.at("k").value == "A");
        assert(service.getSources().size() == 2);
    }

    // Search: case-insensitive, bounded, deterministic.
    {
        service.refresh("en_US", true, {}, {});
        baseline->content["en_US"] = "greeting.one=Hello World\ngreeting.two=Goodbye world\nother=Nothing\n";
        service.refresh();

        auto one = service.search("WORLD", 1);
        assert(one.size() == 1);
        std::set<std::string> worldKeys = {"greeting.one", "greeting.two"};
        assert(worldKeys.count(one[0].key) == 1);

        auto all = service.search("world", 10);
        assert(all.size() == 2);
        assert(service.search("world", 10)[0].key == all[0].key);

        assert(service.search("GREETING.TWO", 10).size() == 1);
        assert(service.search("world", 0).empty());
        assert(service.search("world", -3).empty());
        assert(service.search("absent", 10).empty());
    }

    // Clearing the baseline cache goes through the provider and refreshes.
    {
        int before = notifications;
        service.clearBaselineCache(std::string("en_US"));
        service.clearBaselineCache();
        assert(baseline->cleared.size() == 2);
        assert(baseline->cleared[0] == "en_US");
        assert(baseline->cleared[1] == "*");
        assert(notifications == before + 2);
    }

    // Toggling the baseline via the service.
    {
        service.setBaselineEnabled(false);
        assert(!service.isBaselineEnabled());
        service.refresh();
        assert(service.getAllTranslations().empty());
        service.setBaselineEnabled(true);
        service.refresh();
        assert(service.getAllTranslations().size() == 3);
    }

    // Invalid locale yields an empty table rather than an error.
    {
        auto table = service.refresh("../../etc", false, roots, {});
        assert(table.empty());
    }

    // Readers see whole tables only, while refreshes alternate between two shapes.
    {
        service.unsubscribe(listenerId);
        baseline->content["en_US"] = "x.1=1\nx.2=2\nx.3=3\n";
        baseline->content["de_DE"] = "y.1=1\ny.2=2\n";
        service.refresh("en_US", true, {}, {});

        std::atomic<bool> stop{false};
        std::atomic<bool> torn{false};
        std::vector<std::thread> readers;
        for (int i = 0; i < 4; ++i) {
            readers.emplace_back([&]() {
                while (!stop) {
                    auto snap = service.snapshot();
                    bool english = snap->table.count("x.1") == 1;
                    size_t expectedSize = english ? 3 : 2;
                    if (snap->table.size() != expectedSize || snap->sortedKeys.size() != expectedSize) {
                        torn = true;
                    }
                }
            });
        }

        std::vector<std::thread> writers;
        for (int i = 0; i < 4; ++i) {
            writers.emplace_back([&service, i]() {
                for (int n = 0; n < 10; ++n) {
                    service.refresh((n + i) % 2 == 0 ? "en_US" : "de_DE", true, {}, {});
                }
            });
        }
        for (auto& t : writers) t.join();
        stop = true;
        for (auto& t : readers) t.join();

        assert(!torn);
    }

    fs::remove_all(testRoot);
    std::cout << "[PASS] TranslationService Test." << std::endl;
    return 0;
}
