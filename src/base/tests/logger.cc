#include <gtest/gtest.h>

#include "base/logger.h"

namespace s3etag {
namespace base {
namespace tests {

class LoggerTest : public ::testing::Test {
 protected:
  void TearDown() override { Logger::Init(Logger::Mode::STDERR, LOG_WARNING); }
};

TEST_F(LoggerTest, MaxLevel) {
  Logger::Init(Logger::Mode::STDERR, LOG_WARNING);

  EXPECT_TRUE(Logger::IsEnabled(LOG_ERR));
  EXPECT_TRUE(Logger::IsEnabled(LOG_WARNING));
  EXPECT_FALSE(Logger::IsEnabled(LOG_INFO));
  EXPECT_FALSE(Logger::IsEnabled(LOG_DEBUG));
}

TEST_F(LoggerTest, None) {
  Logger::Init(Logger::Mode::NONE, LOG_DEBUG);

  EXPECT_FALSE(Logger::IsEnabled(LOG_EMERG));
  EXPECT_FALSE(Logger::IsEnabled(LOG_DEBUG));
}

TEST_F(LoggerTest, Syslog) {
  Logger::Init(Logger::Mode::SYSLOG, LOG_INFO);

  EXPECT_TRUE(Logger::IsEnabled(LOG_INFO));
  EXPECT_FALSE(Logger::IsEnabled(LOG_DEBUG));

  S3ETAG_LOG(LOG_DEBUG, "LoggerTest", "dropped\n");
  S3ETAG_LOG(LOG_INFO, "LoggerTest", "logged to syslog (%d)\n", LOG_INFO);

  // switching back closes the syslog connection
  Logger::Init(Logger::Mode::STDERR, LOG_WARNING);
  EXPECT_FALSE(Logger::IsEnabled(LOG_INFO));
}

}  // namespace tests
}  // namespace base
}  // namespace s3etag
