#include <gtest/gtest.h>
#include "test_helpers.h"
#include "violation_engine.h"

namespace {

ViolationEngineSettings defaultSettings() {
    ViolationEngineSettings settings;
    settings.allowedPersons = 1;
    settings.windowLength = 12;
    settings.triggerRatio = 0.35;
    settings.cooldownMs = 4000;
    return settings;
}

std::vector<ClassifiedObject> persons(int count, float confidence = 0.8f) {
    return std::vector<ClassifiedObject>(count, makeObject(ObjectKind::Person, confidence));
}

std::vector<ClassifiedObject> phone(float confidence = 0.7f) {
    return {makeObject(ObjectKind::Person, 0.9f), makeObject(ObjectKind::Device, confidence)};
}

bool containsKind(const std::vector<ViolationAlert>& alerts, ViolationKind kind) {
    for (const auto& alert : alerts) {
        if (alert.kind == kind) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST(ViolationEngineTest, WindowsNeverExceedConfiguredLength) {
    ViolationEngine engine(defaultSettings());
    for (int i = 0; i < 40; i++) {
        engine.update(i % 2 ? persons(2) : phone(), kT0 + i * 2000);
        EXPECT_LE(engine.window(ViolationKind::MultiplePersons).size(), 12u);
        EXPECT_LE(engine.window(ViolationKind::DeviceDetected).size(), 12u);
    }
}

TEST(ViolationEngineTest, ThresholdCrossedByFifthTickOfTwelve) {
    ViolationEngine engine(defaultSettings());
    std::vector<std::vector<ViolationAlert>> perTick;

    for (int i = 0; i < 5; i++) {
        perTick.push_back(engine.update(persons(2), kT0 + i * 2000));
    }
    for (int i = 5; i < 12; i++) {
        perTick.push_back(engine.update(persons(0), kT0 + i * 2000));
    }

    // Ticks 1, 3 and 5 are 4 s apart, so each fires
    EXPECT_TRUE(containsKind(perTick[0], ViolationKind::MultiplePersons));
    EXPECT_FALSE(containsKind(perTick[1], ViolationKind::MultiplePersons));
    EXPECT_TRUE(containsKind(perTick[4], ViolationKind::MultiplePersons));

    const SmoothingWindow& window = engine.window(ViolationKind::MultiplePersons);
    EXPECT_EQ(window.size(), 12u);
    EXPECT_NEAR(window.ratio(), 5.0 / 12.0, 1e-9);
}

TEST(ViolationEngineTest, NoMultiplePersonsAlertWhileWithinAllowance) {
    ViolationEngine engine(defaultSettings());
    for (int i = 0; i < 30; i++) {
        auto alerts = engine.update(persons(i % 2), kT0 + i * 5000);
        EXPECT_FALSE(containsKind(alerts, ViolationKind::MultiplePersons));
    }
    EXPECT_DOUBLE_EQ(engine.window(ViolationKind::MultiplePersons).ratio(), 0.0);
}

TEST(ViolationEngineTest, SingleNoisyFrameDoesNotTriggerOnceWindowIsFull) {
    ViolationEngine engine(defaultSettings());
    for (int i = 0; i < 12; i++) {
        engine.update(persons(1), kT0 + i * 2000);
    }

    // 1/12 stays below 0.35
    auto alerts = engine.update(persons(3), kT0 + 12 * 2000);
    EXPECT_TRUE(alerts.empty());
}

TEST(ViolationEngineTest, CooldownSuppressesRepeatsOfSameKind) {
    ViolationEngine engine(defaultSettings());
    std::vector<int64_t> fired;
    for (int i = 0; i < 20; i++) {
        int64_t now = kT0 + i * 1000;
        if (containsKind(engine.update(phone(), now), ViolationKind::DeviceDetected)) {
            fired.push_back(now);
        }
    }

    ASSERT_GE(fired.size(), 2u);
    for (size_t i = 1; i < fired.size(); i++) {
        EXPECT_GE(fired[i] - fired[i - 1], 4000);
    }
}

TEST(ViolationEngineTest, KindsFireIndependentlyInSameTick) {
    ViolationEngine engine(defaultSettings());
    std::vector<ClassifiedObject> objects = persons(3);
    objects.push_back(makeObject(ObjectKind::Device, 0.66f));

    auto alerts = engine.update(objects, kT0);
    ASSERT_EQ(alerts.size(), 2u);
    EXPECT_EQ(alerts[0].kind, ViolationKind::MultiplePersons);
    EXPECT_EQ(alerts[1].kind, ViolationKind::DeviceDetected);
    EXPECT_EQ(alerts[0].timestampMs, kT0);
    EXPECT_EQ(alerts[1].timestampMs, kT0);
}

TEST(ViolationEngineTest, CooldownOfOneKindDoesNotBlockTheOther) {
    ViolationEngine engine(defaultSettings());
    auto first = engine.update(persons(2), kT0);
    ASSERT_TRUE(containsKind(first, ViolationKind::MultiplePersons));

    // Device appears 1 s later, well inside the persons cooldown
    auto second = engine.update(phone(), kT0 + 1000);
    EXPECT_TRUE(containsKind(second, ViolationKind::DeviceDetected));
    EXPECT_FALSE(containsKind(second, ViolationKind::MultiplePersons));
}

TEST(ViolationEngineTest, AlertCarriesMessageAndBestConfidence) {
    ViolationEngine engine(defaultSettings());
    std::vector<ClassifiedObject> objects = {
        makeObject(ObjectKind::Person, 0.61f),
        makeObject(ObjectKind::Person, 0.93f),
        makeObject(ObjectKind::Device, 0.64f),
        makeObject(ObjectKind::Device, 0.72f),
    };

    auto alerts = engine.update(objects, kT0);
    ASSERT_EQ(alerts.size(), 2u);
    EXPECT_EQ(alerts[0].message, "Multiple people detected (2).");
    EXPECT_FLOAT_EQ(alerts[0].confidence, 0.93f);
    EXPECT_EQ(alerts[1].message, "Mobile device detected in camera.");
    EXPECT_FLOAT_EQ(alerts[1].confidence, 0.72f);
}

TEST(ViolationEngineTest, UnscoredTriggerUsesFallbackConfidence) {
    ViolationEngine engine(defaultSettings());
    std::vector<ClassifiedObject> objects = {
        makeObject(ObjectKind::Person, 0.0f),
        makeObject(ObjectKind::Person, 0.0f),
        makeObject(ObjectKind::Device, 0.0f),
    };

    auto alerts = engine.update(objects, kT0);
    ASSERT_EQ(alerts.size(), 2u);
    EXPECT_FLOAT_EQ(alerts[0].confidence, ViolationEngine::kMultiplePersonsFallbackConfidence);
    EXPECT_FLOAT_EQ(alerts[1].confidence, ViolationEngine::kDeviceFallbackConfidence);
}

TEST(ViolationEngineTest, AlertFromHistoryAloneUsesFallbackConfidence) {
    ViolationEngine engine(defaultSettings());
    engine.update(persons(2), kT0);

    // Nobody in view now, but 1/2 of the window is still above the trigger ratio
    auto alerts = engine.update(persons(0), kT0 + 5000);
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].message, "Multiple people detected (0).");
    EXPECT_FLOAT_EQ(alerts[0].confidence, 0.9f);
}

TEST(ViolationEngineTest, ResetClearsWindowsAndCooldowns) {
    ViolationEngine engine(defaultSettings());
    ASSERT_EQ(engine.update(phone(), kT0).size(), 1u);
    ASSERT_TRUE(engine.update(phone(), kT0 + 100).empty());

    engine.reset();
    EXPECT_EQ(engine.window(ViolationKind::DeviceDetected).size(), 0u);
    EXPECT_EQ(engine.window(ViolationKind::DeviceDetected).getLastAlertMs(), 0);

    // Fires again without waiting for the old cooldown
    EXPECT_EQ(engine.update(phone(), kT0 + 200).size(), 1u);

    for (int i = 1; i < 12; i++) {
        engine.update(phone(), kT0 + 200 + i * 100);
    }
    EXPECT_DOUBLE_EQ(engine.window(ViolationKind::DeviceDetected).ratio(), 1.0);
}

TEST(ViolationEngineTest, IdenticalInputsGiveIdenticalAlerts) {
    std::vector<std::vector<ClassifiedObject>> ticks;
    for (int i = 0; i < 30; i++) {
        std::vector<ClassifiedObject> objects = persons(i % 4 == 0 ? 2 : 1, 0.5f + 0.01f * i);
        if (i % 3 == 0) {
            objects.push_back(makeObject(ObjectKind::Device, 0.7f));
        }
        ticks.push_back(objects);
    }

    auto runOnce = [&ticks]() {
        ViolationEngine engine(defaultSettings());
        std::vector<ViolationAlert> all;
        for (size_t i = 0; i < ticks.size(); i++) {
            auto alerts = engine.update(ticks[i], kT0 + static_cast<int64_t>(i) * 1500);
            all.insert(all.end(), alerts.begin(), alerts.end());
        }
        return all;
    };

    auto first = runOnce();
    auto second = runOnce();
    ASSERT_EQ(first.size(), second.size());
    ASSERT_FALSE(first.empty());
    for (size_t i = 0; i < first.size(); i++) {
        EXPECT_EQ(first[i].kind, second[i].kind);
        EXPECT_EQ(first[i].message, second[i].message);
        EXPECT_EQ(first[i].timestampMs, second[i].timestampMs);
        EXPECT_FLOAT_EQ(first[i].confidence, second[i].confidence);
    }
}

TEST(ViolationEngineTest, RatioEqualToTriggerFires) {
    ViolationEngineSettings settings = defaultSettings();
    settings.windowLength = 5;
    settings.triggerRatio = 0.6;
    settings.cooldownMs = 0;
    ViolationEngine engine(settings);

    const std::vector<ClassifiedObject> none;
    const std::vector<ClassifiedObject> device = {makeObject(ObjectKind::Device, 0.7f)};

    EXPECT_TRUE(engine.update(none, kT0).empty());
    EXPECT_TRUE(engine.update(none, kT0 + 2000).empty());
    EXPECT_TRUE(engine.update(device, kT0 + 4000).empty());
    EXPECT_TRUE(engine.update(device, kT0 + 6000).empty());

    // 3 of 5
    auto alerts = engine.update(device, kT0 + 8000);
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].kind, ViolationKind::DeviceDetected);
}
