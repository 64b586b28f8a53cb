#include <gtest/gtest.h>
#include <codegraph/manifest/dependency_extractor.h>

#include "temp_dir_scope.hpp"

using namespace codegraph;
using namespace codegraph::manifest;
using codegraph::test_support::TempDirScope;

TEST(DependencyExtractorTest, ScansMavenAndGradleWithMavenPrecedence) {
    auto dir = TempDirScope::unique_under("codegraph_manifests");
    dir.write("pom.xml", R"(<project>
  <groupId>com.acme</groupId>
  <artifactId>app</artifactId>
  <version>1.0</version>
  <dependencies>
    <dependency>
      <groupId>com.google.guava</groupId>
      <artifactId>guava</artifactId>
      <version>31.0-jre</version>
    </dependency>
  </dependencies>
</project>
)");
    dir.write("tool/build.gradle", R"(dependencies {
    implementation 'com.google.guava:guava:32.1.2-jre'
    implementation 'org.slf4j:slf4j-api:2.0.9'
}
)");
    dir.write("target/pom.xml", "<project><broken>");

    auto scan = scanManifests(dir.path(), {"target"});
    ASSERT_TRUE(scan) << scan.error().message;
    EXPECT_EQ(scan.value().mavenManifests, 1u);
    EXPECT_EQ(scan.value().gradleManifests, 1u);
    EXPECT_EQ(scan.value().manifestsScanned(), 2u);
    EXPECT_TRUE(scan.value().errors.empty());
    EXPECT_EQ(scan.value().coordinates.size(), 3u);

    const auto& map = scan.value().map;
    EXPECT_EQ(map.version("com.google.guava.guava"), std::optional<std::string>("31.0-jre"));
    EXPECT_EQ(map.version("org.slf4j:slf4j-api"), std::optional<std::string>("2.0.9"));
    EXPECT_EQ(map.lookup("org.slf4j.Logger").version, std::optional<std::string>("2.0.9"));
}

TEST(DependencyExtractorTest, MalformedPomIsRecordedAndSkipped) {
    auto dir = TempDirScope::unique_under("codegraph_manifests");
    dir.write("a/pom.xml", "<project><dependencies></project>");
    dir.write("b/pom.xml", R"(<project>
  <dependencies>
    <dependency>
      <groupId>junit</groupId>
      <artifactId>junit</artifactId>
      <version>4.13.2</version>
    </dependency>
  </dependencies>
</project>
)");

    auto scan = scanManifests(dir.path(), {});
    ASSERT_TRUE(scan) << scan.error().message;
    EXPECT_EQ(scan.value().mavenManifests, 1u);
    ASSERT_EQ(scan.value().errors.size(), 1u);
    EXPECT_EQ(scan.value().errors.errors()[0].path, "a/pom.xml");
    EXPECT_EQ(scan.value().map.version("junit.junit"), std::optional<std::string>("4.13.2"));
}

TEST(DependencyExtractorTest, MissingRootIsAnError) {
    auto dir = TempDirScope::unique_under("codegraph_manifests");
    auto scan = scanManifests(dir.path() / "nope", {});
    ASSERT_FALSE(scan);
    EXPECT_EQ(scan.error().code, ErrorCode::FileNotFound);
}
