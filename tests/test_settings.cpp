/**
 * @file test_settings.cpp
 * @brief Unit tests for SQLiteConnection, SettingsStore and PracticeSettings
 */

#include <catch2/catch_all.hpp>
#include <drumsync/InputMapper.hpp>
#include <drumsync/PracticeSettings.hpp>
#include <drumsync/data/SQLiteConnection.hpp>
#include <drumsync/data/SettingsStore.hpp>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <type_traits>

using namespace drumsync;
using namespace drumsync::data;

TEST_CASE("SQLiteConnection in memory", "[SQLiteConnection]") {
    SQLiteConnection db;
    CHECK_FALSE(db.isOpen());
    REQUIRE(db.openMemory());
    CHECK(db.isOpen());
    CHECK(db.getPath() == ":memory:");

    REQUIRE(db.execute("CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT, ratio REAL, extra TEXT)"));
    REQUIRE(db.execute("INSERT INTO t (id, name, ratio, extra) VALUES (?, ?, ?, ?)",
                       {int64_t(1), std::string("one"), 0.5, nullptr}));
    CHECK(db.changesCount() == 1);

    auto rows = db.query("SELECT id, name, ratio, extra FROM t WHERE id = ?", {int64_t(1)});
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].size() == 4);
    CHECK(rows[0].getInt(0) == 1);
    CHECK(rows[0].getString(1) == "one");
    CHECK(rows[0].getDouble(2) == 0.5);
    CHECK(rows[0].isNull(3));

    SECTION("Numeric widening and truncation") {
        CHECK(rows[0].getDouble(0) == 1.0);
        CHECK(rows[0].getInt(2) == 0);
        CHECK(rows[0].getInt(1) == 0);
    }

    SECTION("Rollback discards changes") {
        REQUIRE(db.beginTransaction());
        REQUIRE(db.execute("DELETE FROM t"));
        REQUIRE(db.rollback());
        CHECK(db.query("SELECT id FROM t").size() == 1);
    }

    SECTION("Errors are reported, not thrown") {
        CHECK_FALSE(db.execute("INSERT INTO missing VALUES (1)"));
        CHECK_FALSE(db.lastError().empty());
        CHECK(db.query("SELECT * FROM missing").empty());
    }

    db.close();
    CHECK_FALSE(db.isOpen());
}

TEST_CASE("SettingsStore practice speeds", "[SettingsStore]") {
    auto store = SettingsStore::openMemory();

    CHECK_FALSE(store->loadSpeed("groove").has_value());

    store->saveSpeed("groove", 0.75);
    CHECK(store->loadSpeed("groove").value_or(0.0) == Catch::Approx(0.75));

    // Saving again replaces the value
    store->saveSpeed("groove", 1.25);
    CHECK(store->loadSpeed("groove").value_or(0.0) == Catch::Approx(1.25));

    store->saveSpeed("ballad", 0.5);
    store->clearSpeeds();
    CHECK_FALSE(store->loadSpeed("groove").has_value());
    CHECK_FALSE(store->loadSpeed("ballad").has_value());
}

TEST_CASE("SettingsStore cannot open a bad path", "[SettingsStore]") {
    CHECK_THROWS_AS(SettingsStore::open("/nonexistent-dir/settings.db"), SettingsError);
}

TEST_CASE("SettingsStore is only handed out opened", "[SettingsStore]") {
    STATIC_REQUIRE_FALSE(std::is_default_constructible_v<SettingsStore>);

    auto store = SettingsStore::openMemory();
    CHECK(store.use_count() == 1);
    CHECK(store->getPath() == ":memory:");
}

TEST_CASE("SettingsStore input mappings", "[SettingsStore]") {
    auto store = SettingsStore::openMemory();

    SECTION("Nothing saved leaves the mapper alone") {
        InputMapper mapper;
        mapper.setKeyBinding(DrumType::Kick, "b");
        CHECK_FALSE(store->loadMappings(mapper));
        CHECK(mapper.drumForKey("b") == DrumType::Kick);
    }

    SECTION("Saved bindings come back") {
        InputMapper saved;
        saved.setKeyBinding(DrumType::Kick, "b");
        saved.setMidiBinding(DrumType::Snare, 40);
        store->saveMappings(saved);

        InputMapper loaded;
        REQUIRE(store->loadMappings(loaded));
        CHECK(loaded.getKeyMappings() == saved.getKeyMappings());
        CHECK(loaded.getMidiMappings() == saved.getMidiMappings());
        CHECK(loaded.drumForKey("space") != DrumType::Kick);
        CHECK(loaded.drumForMidiNote(40) == DrumType::Snare);
    }
}

TEST_CASE("SettingsStore skips unusable mapping rows", "[SettingsStore]") {
    const auto path = (std::filesystem::temp_directory_path() / "drumsync_settings_test.db").string();
    std::filesystem::remove(path);

    {
        auto store = SettingsStore::open(path);
        CHECK(store->getPath() == path);
        store->saveMappings(InputMapper());
    }

    {
        SQLiteConnection db;
        REQUIRE(db.open(path));
        REQUIRE(db.execute("INSERT INTO input_mapping (kind, input, drum) VALUES ('key', 'q', 'gong')"));
        REQUIRE(db.execute("INSERT INTO input_mapping (kind, input, drum) VALUES ('midi', '200', 'snare')"));
        REQUIRE(db.execute("INSERT INTO input_mapping (kind, input, drum) VALUES ('midi', 'x1', 'snare')"));
        REQUIRE(db.execute("UPDATE input_mapping SET input = 'b' WHERE kind = 'key' AND drum = 'kick'"));
    }

    auto store = SettingsStore::open(path);
    InputMapper loaded;
    REQUIRE(store->loadMappings(loaded));
    CHECK(loaded.drumForKey("b") == DrumType::Kick);
    CHECK_FALSE(loaded.drumForKey("q").has_value());
    CHECK(loaded.getMidiMappings() == InputMapper::defaultMidiMappings());

    store.reset();
    std::filesystem::remove(path);
}

TEST_CASE("PracticeSettings speed", "[PracticeSettings]") {
    PracticeSettings settings;
    CHECK(settings.getSpeed() == PracticeSettings::DEFAULT_SPEED);
    CHECK(settings.formattedSpeed() == "100%");

    SECTION("Clamped to the supported range") {
        settings.setSpeed(3.0);
        CHECK(settings.getSpeed() == PracticeSettings::MAX_SPEED);
        settings.setSpeed(0.1);
        CHECK(settings.getSpeed() == PracticeSettings::MIN_SPEED);
    }

    SECTION("Non-finite values are ignored") {
        settings.setSpeed(0.75);
        settings.setSpeed(std::numeric_limits<double>::quiet_NaN());
        CHECK(settings.getSpeed() == Catch::Approx(0.75));
        settings.setSpeed(std::numeric_limits<double>::infinity());
        CHECK(settings.getSpeed() == Catch::Approx(0.75));
    }

    SECTION("Steps land on the grid") {
        settings.setSpeed(0.5);
        for (int i = 0; i < 5; ++i) {
            settings.increaseSpeed();
        }
        CHECK(settings.getSpeed() == Catch::Approx(0.75));
        CHECK(settings.formattedSpeed() == "75%");

        settings.setSpeed(PracticeSettings::MIN_SPEED);
        settings.decreaseSpeed();
        CHECK(settings.getSpeed() == PracticeSettings::MIN_SPEED);
    }

    SECTION("Effective tempo") {
        settings.setSpeed(0.75);
        CHECK(settings.effectiveBpm(120.0) == Catch::Approx(90.0));
        CHECK(settings.formattedEffectiveBpm(120.0) == "90 BPM");
    }

    SECTION("Presets are all in range") {
        for (double preset : PracticeSettings::SPEED_PRESETS) {
            settings.setSpeed(preset);
            CHECK(settings.getSpeed() == Catch::Approx(preset));
        }
    }

    SECTION("Without a store nothing is remembered") {
        settings.saveSpeed(0.5, "groove");
        CHECK(settings.loadSpeed("groove") == PracticeSettings::DEFAULT_SPEED);
        settings.clearAllSavedSpeeds();
    }
}

TEST_CASE("PracticeSettings persistence", "[PracticeSettings]") {
    auto store = SettingsStore::openMemory();
    PracticeSettings settings(store);

    CHECK(settings.loadSpeed("groove") == PracticeSettings::DEFAULT_SPEED);

    settings.saveSpeed(0.75, "groove");
    CHECK(settings.loadSpeed("groove") == Catch::Approx(0.75));

    settings.loadAndApplySpeed("groove");
    CHECK(settings.getSpeed() == Catch::Approx(0.75));

    settings.loadAndApplySpeed("other");
    CHECK(settings.getSpeed() == PracticeSettings::DEFAULT_SPEED);

    settings.clearAllSavedSpeeds();
    CHECK(settings.loadSpeed("groove") == PracticeSettings::DEFAULT_SPEED);
}
