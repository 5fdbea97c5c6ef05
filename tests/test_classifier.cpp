#include <gtest/gtest.h>
#include "classifier.h"
#include "test_helpers.h"

namespace {

Classifier makeClassifier() {
    return Classifier(0.55f, 0.60f, {"cell phone"});
}

} // namespace

TEST(ClassifierTest, DeviceJustBelowThresholdIsIgnored) {
    Classifier classifier = makeClassifier();
    auto objects = classifier.classify({makeDetection("cell phone", 0.59f)});
    EXPECT_TRUE(objects.empty());

    DetectionSnapshot snapshot = Classifier::snapshot(objects);
    EXPECT_FALSE(snapshot.deviceDetected);
}

TEST(ClassifierTest, DeviceAtThresholdIsKept) {
    Classifier classifier = makeClassifier();
    auto objects = classifier.classify({makeDetection("cell phone", 0.60f)});
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].kind, ObjectKind::Device);
    EXPECT_FLOAT_EQ(objects[0].confidence, 0.60f);
}

TEST(ClassifierTest, DeviceLabelsAreCaseInsensitive) {
    Classifier classifier(0.55f, 0.60f, {"Cell Phone", "laptop"});
    auto objects = classifier.classify({
        makeDetection("CELL PHONE", 0.7f),
        makeDetection("Laptop", 0.8f),
    });
    ASSERT_EQ(objects.size(), 2u);
    EXPECT_EQ(objects[0].kind, ObjectKind::Device);
    EXPECT_EQ(objects[1].kind, ObjectKind::Device);
}

TEST(ClassifierTest, PersonLabelMustMatchExactly) {
    Classifier classifier = makeClassifier();
    auto objects = classifier.classify({
        makeDetection("person", 0.56f),
        makeDetection("Person", 0.9f),
        makeDetection("person", 0.54f),
    });
    ASSERT_EQ(objects.size(), 1u);
    EXPECT_EQ(objects[0].kind, ObjectKind::Person);
    EXPECT_FLOAT_EQ(objects[0].confidence, 0.56f);
}

TEST(ClassifierTest, KeepsInputOrderAndBoxes) {
    Classifier classifier = makeClassifier();
    auto objects = classifier.classify({
        makeDetection("cell phone", 0.8f, 10, 20, 30, 40),
        makeDetection("chair", 0.99f),
        makeDetection("person", 0.7f, 50, 60, 70, 80),
    });
    ASSERT_EQ(objects.size(), 2u);
    EXPECT_EQ(objects[0].kind, ObjectKind::Device);
    EXPECT_FLOAT_EQ(objects[0].bbox.x, 10.0f);
    EXPECT_FLOAT_EQ(objects[0].bbox.height, 40.0f);
    EXPECT_EQ(objects[1].kind, ObjectKind::Person);
    EXPECT_FLOAT_EQ(objects[1].bbox.width, 70.0f);
}

TEST(ClassifierTest, SnapshotPrefersDeviceConfidence) {
    std::vector<ClassifiedObject> objects = {
        makeObject(ObjectKind::Person, 0.95f),
        makeObject(ObjectKind::Device, 0.65f),
        makeObject(ObjectKind::Person, 0.70f),
        makeObject(ObjectKind::Device, 0.75f),
    };

    DetectionSnapshot snapshot = Classifier::snapshot(objects);
    EXPECT_EQ(snapshot.personCount, 2);
    EXPECT_TRUE(snapshot.deviceDetected);
    EXPECT_FLOAT_EQ(snapshot.confidence, 0.75f);
    EXPECT_EQ(snapshot.objects.size(), 4u);
}

TEST(ClassifierTest, SnapshotFallsBackToPersonConfidence) {
    DetectionSnapshot snapshot = Classifier::snapshot({
        makeObject(ObjectKind::Person, 0.6f),
        makeObject(ObjectKind::Person, 0.8f),
    });
    EXPECT_EQ(snapshot.personCount, 2);
    EXPECT_FALSE(snapshot.deviceDetected);
    EXPECT_FLOAT_EQ(snapshot.confidence, 0.8f);
}

TEST(ClassifierTest, EmptySnapshotHasZeroConfidence) {
    DetectionSnapshot snapshot = Classifier::snapshot({});
    EXPECT_EQ(snapshot.personCount, 0);
    EXPECT_FALSE(snapshot.deviceDetected);
    EXPECT_FLOAT_EQ(snapshot.confidence, 0.0f);
    EXPECT_TRUE(snapshot.objects.empty());
}

TEST(ClassifierTest, UnscoredDeviceGetsNoSubstituteConfidence) {
    DetectionSnapshot snapshot = Classifier::snapshot({
        makeObject(ObjectKind::Device, 0.0f),
        makeObject(ObjectKind::Person, 0.9f),
    });
    EXPECT_TRUE(snapshot.deviceDetected);
    EXPECT_FLOAT_EQ(snapshot.confidence, 0.0f);
}
