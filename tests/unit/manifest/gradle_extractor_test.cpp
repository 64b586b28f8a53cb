#include <gtest/gtest.h>
#include <codegraph/manifest/gradle_extractor.h>

#include <algorithm>

using namespace codegraph::manifest;

namespace {

const Coordinate* findCoordinate(const std::vector<Coordinate>& coords,
                                 const std::string& artifact) {
    auto it = std::find_if(coords.begin(), coords.end(),
                           [&](const Coordinate& c) { return c.artifact == artifact; });
    return it == coords.end() ? nullptr : &*it;
}

} // namespace

TEST(GradleExtractorTest, GroovyStringAndMapNotation) {
    const std::string script = R"(
ext {
    jacksonVersion = '2.15.0'
}
dependencies {
    implementation 'com.google.guava:guava:32.1.2-jre'
    implementation "com.fasterxml.jackson.core:jackson-databind:${jacksonVersion}"
    testImplementation group: 'junit', name: 'junit', version: '4.13.2'
    runtimeOnly "org.postgresql:postgresql:$pgVersion"
}
)";
    auto coords = parseGradleScript(script);
    ASSERT_EQ(coords.size(), 3u);

    const auto* guava = findCoordinate(coords, "guava");
    ASSERT_NE(guava, nullptr);
    EXPECT_EQ(guava->group, "com.google.guava");
    EXPECT_EQ(guava->version, "32.1.2-jre");

    const auto* databind = findCoordinate(coords, "jackson-databind");
    ASSERT_NE(databind, nullptr);
    EXPECT_EQ(databind->version, "2.15.0");

    const auto* junit = findCoordinate(coords, "junit");
    ASSERT_NE(junit, nullptr);
    EXPECT_EQ(junit->scope, "test");

    // pgVersion is never declared
    EXPECT_EQ(findCoordinate(coords, "postgresql"), nullptr);
}

TEST(GradleExtractorTest, KotlinDsl) {
    const std::string script = R"(
val kotlinVersion = "1.9.0"
dependencies {
    implementation("org.jetbrains.kotlin:kotlin-stdlib:$kotlinVersion")
    compileOnly(group = "org.projectlombok", name = "lombok", version = "1.18.30")
}
)";
    auto coords = parseGradleScript(script);
    ASSERT_EQ(coords.size(), 2u);

    const auto* stdlib = findCoordinate(coords, "kotlin-stdlib");
    ASSERT_NE(stdlib, nullptr);
    EXPECT_EQ(stdlib->version, "1.9.0");

    const auto* lombok = findCoordinate(coords, "lombok");
    ASSERT_NE(lombok, nullptr);
    EXPECT_EQ(lombok->group, "org.projectlombok");
    EXPECT_EQ(lombok->scope, "provided");
}

TEST(GradleExtractorTest, VersionVariablesAndChains) {
    auto vars = collectVersionVariables("def springVersion = '6.0.1'\nname = 'app'\n"
                                        "bootVersion = \"${springVersion}\"\n");
    EXPECT_EQ(vars.count("name"), 0u);
    ASSERT_EQ(vars.count("springVersion"), 1u);

    EXPECT_EQ(resolveVersionReference("${bootVersion}", vars), std::optional<std::string>("6.0.1"));
    EXPECT_EQ(resolveVersionReference("1.0", vars), std::optional<std::string>("1.0"));
    EXPECT_FALSE(resolveVersionReference("$unknownVersion", vars).has_value());
}

TEST(GradleExtractorTest, SelfReferenceDoesNotLoop) {
    VersionVariables vars{{"loopVersion", "$loopVersion"}};
    EXPECT_FALSE(resolveVersionReference("$loopVersion", vars).has_value());
}
