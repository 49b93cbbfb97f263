#include <gtest/gtest.h>

#include "core/PackageTypes.hpp"

using namespace pkgstore;

TEST(PackageTypesTest, ParsesNamesAndNumbers) {
  EXPECT_EQ(parseUsage("core"), PackageUsage::Core);
  EXPECT_EQ(parseUsage("CONTROLLER"), PackageUsage::Controller);
  EXPECT_EQ(parseUsage("3"), PackageUsage::Companion);
  EXPECT_FALSE(parseUsage("0").has_value());
  EXPECT_FALSE(parseUsage("agent").has_value());

  EXPECT_EQ(parseArch("arm64-v8a"), PackageArch::Arm64V8a);
  EXPECT_EQ(parseArch("arm64"), PackageArch::Arm64V8a);
  EXPECT_EQ(parseArch("armeabi_v7a"), PackageArch::ArmeabiV7a);
  EXPECT_EQ(parseArch("0"), PackageArch::NoArch);
  EXPECT_FALSE(parseArch("x86").has_value());
  EXPECT_FALSE(parseArch("2x").has_value());
}

TEST(PackageTypesTest, NamesRoundTripThroughParse) {
  for (auto u : {PackageUsage::Core, PackageUsage::Controller, PackageUsage::Companion}) {
    EXPECT_EQ(parseUsage(to_string(u)), u);
  }
  for (auto a : {PackageArch::NoArch, PackageArch::ArmeabiV7a, PackageArch::Arm64V8a}) {
    EXPECT_EQ(parseArch(to_string(a)), a);
  }
}

TEST(PackageTypesTest, FilenameIsDeterministic) {
  const PackageKey key{PackageUsage::Core, PackageArch::Arm64V8a};
  EXPECT_EQ(generateFilename(key, "1.0", kApkMimetype), "core_arm64-v8a_1.0.apk");
  EXPECT_EQ(generateFilename(key, "1.0", kApkMimetype), generateFilename(key, "1.0", kApkMimetype));
  EXPECT_EQ(generateFilename(key, "2.1", kZipMimetype), "core_arm64-v8a_2.1.zip");
  EXPECT_EQ(generateFilename({PackageUsage::Companion, PackageArch::NoArch}, "3", "text/plain"),
            "companion_noarch_3.bin");
}

TEST(PackageTypesTest, FilenameSanitizesVersion) {
  const PackageKey key{PackageUsage::Controller, PackageArch::ArmeabiV7a};
  EXPECT_EQ(generateFilename(key, "../1 0/x", kApkMimetype), "controller_armeabi-v7a_.._1_0_x.apk");
}

TEST(PackageTypesTest, KeysOrderByUsageThenArch) {
  PackageKey a{PackageUsage::Core, PackageArch::Arm64V8a};
  PackageKey b{PackageUsage::Controller, PackageArch::NoArch};
  EXPECT_TRUE(a < b);
  EXPECT_FALSE(b < a);
  EXPECT_NE(a, b);
  EXPECT_EQ(to_string(a), "core/arm64-v8a");
}
