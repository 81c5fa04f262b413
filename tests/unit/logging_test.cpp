// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "core/logging.hpp"

#include <gtest/gtest.h>

#include "test_utils/upload_builder.hpp"

namespace acr_qa::logging::test {

class LoggingTest : public ::testing::Test {
protected:
    void TearDown() override {
        LoggerFactory::configure(LogConfig{});
    }
};

TEST_F(LoggingTest, LevelNamesRoundTrip) {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warning,
                       LogLevel::Error, LogLevel::Critical, LogLevel::Off}) {
        auto parsed = logLevelFromString(toString(level));
        ASSERT_TRUE(parsed.has_value()) << toString(level);
        EXPECT_EQ(*parsed, level);
    }
}

TEST_F(LoggingTest, LevelParsingIsCaseInsensitive) {
    EXPECT_EQ(logLevelFromString("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(logLevelFromString("Warn"), LogLevel::Warning);
    EXPECT_FALSE(logLevelFromString("chatty").has_value());
    EXPECT_FALSE(logLevelFromString("").has_value());
}

TEST_F(LoggingTest, SameNameReturnsSameLogger) {
    auto a = LoggerFactory::create("LoggingTestSameName");
    auto b = LoggerFactory::create("LoggingTestSameName");
    EXPECT_EQ(a.get(), b.get());
}

TEST_F(LoggingTest, GlobalLevelAppliesToExistingLoggers) {
    auto logger = LoggerFactory::create("LoggingTestGlobalLevel");

    LoggerFactory::setGlobalLevel(LogLevel::Error);
    EXPECT_EQ(LoggerFactory::getGlobalLevel(), LogLevel::Error);
    EXPECT_FALSE(logger->should_log(spdlog::level::info));
    EXPECT_TRUE(logger->should_log(spdlog::level::err));

    LoggerFactory::setGlobalLevel(LogLevel::Debug);
    EXPECT_TRUE(logger->should_log(spdlog::level::debug));
}

TEST_F(LoggingTest, FileLoggingWritesIntoLogDirectory) {
    test_utils::TempDirectory scratch("acr_qa_logging_test");
    LogConfig config;
    config.level = LogLevel::Info;
    config.enableFileLogging = true;
    config.logDirectory = scratch.path() / "logs";
    LoggerFactory::configure(config);

    auto logger = LoggerFactory::create("LoggingTestFileSink");
    logger->info("hello from the file sink test");
    logger->flush();

    auto logFile = config.logDirectory / "acr_qa.log";
    ASSERT_TRUE(std::filesystem::exists(logFile));
    EXPECT_NE(test_utils::readText(logFile).find("hello from the file sink test"),
              std::string::npos);

    spdlog::drop("LoggingTestFileSink");
}

} // namespace acr_qa::logging::test
