#include <gtest/gtest.h>

#include "core/downloader/ResumeDataValidator.hpp"
#include "utils/PathUtils.hpp"
#include "utils/TestUtils.hpp"

using namespace tether::core::downloader;
using namespace tether::test;

class ResumeDataValidatorTest : public ::testing::Test {
protected:
    TempDirectory dir_{"tether_resume"};
};

TEST_F(ResumeDataValidatorTest, EmptyBlobIsNotResumable) {
    EXPECT_FALSE(ResumeDataValidator::isResumable({}));
    EXPECT_FALSE(ResumeDataValidator::partialFilePath({}).has_value());
}

TEST_F(ResumeDataValidatorTest, GarbageIsNotResumable) {
    EXPECT_FALSE(ResumeDataValidator::isResumable(toResumeData(std::string("\x01\x02not json"))));
    EXPECT_FALSE(ResumeDataValidator::isResumable(toResumeData(std::string("[1, 2, 3]"))));
    EXPECT_FALSE(ResumeDataValidator::isResumable(toResumeData(std::string("{\"localPath\": "))));
}

TEST_F(ResumeDataValidatorTest, ExistingLocalPathIsResumable) {
    auto partial = writeFile(dir_.path() / "a.part", "12345");
    auto blob = toResumeData(nlohmann::json{{"localPath", partial.string()}});

    EXPECT_TRUE(ResumeDataValidator::isResumable(blob));
    EXPECT_EQ(*ResumeDataValidator::partialFilePath(blob), partial);
}

TEST_F(ResumeDataValidatorTest, MissingLocalPathIsNotResumable) {
    auto blob = toResumeData(nlohmann::json{{"localPath", (dir_.path() / "gone.part").string()}});
    EXPECT_FALSE(ResumeDataValidator::isResumable(blob));
}

TEST_F(ResumeDataValidatorTest, DirectoryIsNotAPartialFile) {
    auto blob = toResumeData(nlohmann::json{{"localPath", dir_.str()}});
    EXPECT_FALSE(ResumeDataValidator::isResumable(blob));
}

TEST_F(ResumeDataValidatorTest, LocalPathWinsOverTempFileName) {
    auto partial = writeFile(dir_.path() / "real.part", "x");
    auto blob = toResumeData(nlohmann::json{
        {"localPath", partial.string()},
        {"tempFileName", "does-not-exist.part"}
    });

    EXPECT_EQ(*ResumeDataValidator::partialFilePath(blob), partial);
    EXPECT_TRUE(ResumeDataValidator::isResumable(blob));
}

TEST_F(ResumeDataValidatorTest, TempFileNameResolvesInTempDirectory) {
    std::string name = dir_.path().filename().string() + "-partial.tmp";
    auto partial = tether::utils::PathUtils::getTempPath() / name;

    auto blob = toResumeData(nlohmann::json{{"localPath", ""}, {"tempFileName", name}});
    EXPECT_EQ(*ResumeDataValidator::partialFilePath(blob), partial);
    EXPECT_FALSE(ResumeDataValidator::isResumable(blob));

    writeFile(partial, "abc");
    EXPECT_TRUE(ResumeDataValidator::isResumable(blob));

    std::error_code ec;
    std::filesystem::remove(partial, ec);
}
