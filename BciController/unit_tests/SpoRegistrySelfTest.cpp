#include <stdexcept>
#include "SelfTest.hpp"
#include "../src/spo/SpoRegistry.hpp"

/* TEST COMPONENTS:
- SpoRegistry_C populate by tag (selectable filter, contiguous pool indices, registration order)
- Predefined keeps contents, Children + unknown names leave the registry alone
- get() bounds
*/

namespace {

struct Fixture_S {
    LoggedSpo_C a{"a"};
    LoggedSpo_C hidden{"hidden", false};
    LoggedSpo_C b{"b"};
    LoggedSpo_C other{"other"};
    LoggedSpo_C c{"c"};
    SpoDirectory_C directory;
    ControllerConfig_S config;

    Fixture_S() {
        directory.register_spo("BCI", &a);
        directory.register_spo("BCI", &hidden);
        directory.register_spo("BCI", &b);
        directory.register_spo("Menu", &other);
        directory.register_spo("BCI", &c);
    }
};

void test_tag_population() {
    Fixture_S fx;
    SpoRegistry_C registry(fx.directory, fx.config);
    SELFTEST_CHECK(registry.empty());

    SELFTEST_CHECK(registry.populate(SpoPopulation_Tag));
    SELFTEST_CHECK(registry.count() == 3);
    SELFTEST_CHECK(registry.get(0) == &fx.a);
    SELFTEST_CHECK(registry.get(1) == &fx.b);
    SELFTEST_CHECK(registry.get(2) == &fx.c);
    for (std::size_t i = 0; i < registry.count(); ++i) {
        SELFTEST_CHECK(registry.get(i)->get_pool_index() == static_cast<int>(i));
        SELFTEST_CHECK(registry.get(i)->is_selectable());
    }
    SELFTEST_CHECK(fx.hidden.get_pool_index() == -1);
    SELFTEST_CHECK(fx.other.get_pool_index() == -1);
}

void test_repopulate_reindexes() {
    Fixture_S fx;
    SpoRegistry_C registry(fx.directory, fx.config);
    registry.populate();

    fx.a.set_selectable(false);
    fx.hidden.set_selectable(true);
    SELFTEST_CHECK(registry.populate(SpoPopulation_Tag));
    SELFTEST_CHECK(registry.count() == 3);
    SELFTEST_CHECK(registry.get(0) == &fx.hidden);
    SELFTEST_CHECK(fx.hidden.get_pool_index() == 0);
    SELFTEST_CHECK(fx.b.get_pool_index() == 1);
    SELFTEST_CHECK(fx.c.get_pool_index() == 2);

    // group tag is read at populate time
    fx.config.groupTag = "Menu";
    SELFTEST_CHECK(registry.populate("Tag"));
    SELFTEST_CHECK(registry.count() == 1);
    SELFTEST_CHECK(registry.get(0) == &fx.other);

    fx.config.groupTag = "Nothing";
    SELFTEST_CHECK(registry.populate(SpoPopulation_Tag));
    SELFTEST_CHECK(registry.empty());
}

void test_invalid_items_skipped() {
    Fixture_S fx;
    fx.b.set_valid(false); // object destroyed but still tagged
    SpoRegistry_C registry(fx.directory, fx.config);
    SELFTEST_CHECK(registry.populate(SpoPopulation_Tag));
    SELFTEST_CHECK(registry.count() == 2);
    SELFTEST_CHECK(registry.get(0) == &fx.a);
    SELFTEST_CHECK(registry.get(1) == &fx.c);
    SELFTEST_CHECK(fx.c.get_pool_index() == 1);
    SELFTEST_CHECK(fx.b.get_pool_index() == -1);
}

void test_predefined_and_children() {
    Fixture_S fx;
    SpoRegistry_C registry(fx.directory, fx.config);
    registry.set_predefined({&fx.c, nullptr, &fx.other});
    SELFTEST_CHECK(registry.count() == 2);
    SELFTEST_CHECK(fx.c.get_pool_index() == 0);
    SELFTEST_CHECK(fx.other.get_pool_index() == 1);

    SELFTEST_CHECK(registry.populate(SpoPopulation_Predefined));
    SELFTEST_CHECK(registry.count() == 2);
    SELFTEST_CHECK(registry.get(0) == &fx.c);

    SELFTEST_CHECK(!registry.populate(SpoPopulation_Children));
    SELFTEST_CHECK(registry.count() == 2);

    SELFTEST_CHECK(!registry.populate("ByColour"));
    SELFTEST_CHECK(!registry.populate("tag")); // names are exact
    SELFTEST_CHECK(registry.count() == 2);
    SELFTEST_CHECK(registry.populate("Predefined"));
    SELFTEST_CHECK(registry.count() == 2);
}

void test_get_out_of_range() {
    Fixture_S fx;
    SpoRegistry_C registry(fx.directory, fx.config);
    registry.populate();

    bool threw = false;
    try {
        registry.get(3);
    }
    catch (const std::out_of_range& e) {
        threw = true;
        LOG_ALWAYS("expected: " << e.what());
    }
    SELFTEST_CHECK(threw);
}

void test_directory_unregister() {
    Fixture_S fx;
    SELFTEST_CHECK(fx.directory.size() == 5);
    SELFTEST_CHECK(fx.directory.unregister_spo(&fx.b));
    SELFTEST_CHECK(!fx.directory.unregister_spo(&fx.b));
    SELFTEST_CHECK(fx.directory.list_tagged_spos("BCI").size() == 3);

    SpoRegistry_C registry(fx.directory, fx.config);
    registry.populate();
    SELFTEST_CHECK(registry.count() == 2);
    SELFTEST_CHECK(registry.get(1) == &fx.c);
}

} // namespace

int main() {
    logger::tlabel = "SpoRegistrySelfTest";
    LOG_ALWAYS("SpoRegistrySelfTest starting...");

    RUN_SELFTEST(test_tag_population);
    RUN_SELFTEST(test_repopulate_reindexes);
    RUN_SELFTEST(test_invalid_items_skipped);
    RUN_SELFTEST(test_predefined_and_children);
    RUN_SELFTEST(test_get_out_of_range);
    RUN_SELFTEST(test_directory_unregister);

    return selftest::finish("SpoRegistrySelfTest");
}
