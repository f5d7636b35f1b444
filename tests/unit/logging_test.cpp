#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace {

using namespace clusterlink;
using observability::BoolField;
using observability::FormatFields;
using observability::IntField;
using observability::ParseLevel;
using observability::StringField;

void TestParseLevel() {
  assert(ParseLevel("debug") == spdlog::level::debug);
  assert(ParseLevel("INFO") == spdlog::level::info);
  assert(ParseLevel("warn") == spdlog::level::warn);
  assert(ParseLevel("warning") == spdlog::level::warn);
  assert(ParseLevel("error") == spdlog::level::err);
  assert(ParseLevel("off") == spdlog::level::off);
  assert(!ParseLevel("verbose"));
  assert(!ParseLevel(""));
}

void TestPlainFieldsAreUnquoted() {
  assert(FormatFields({}).empty());
  assert(FormatFields({StringField("queue", "airm_common"), IntField("delivery_tag", 7), BoolField("redelivered", false)}) ==
         "queue=airm_common delivery_tag=7 redelivered=false");
}

void TestAwkwardValuesAreQuoted() {
  assert(FormatFields({StringField("error", "channel closed")}) == R"(error="channel closed")");
  assert(FormatFields({StringField("body", R"({"a":1})")}) == R"(body="{\"a\":1}")");
  assert(FormatFields({StringField("pair", "k=v")}) == R"(pair="k=v")");
  assert(FormatFields({StringField("user", "")}) == R"(user="")");
  assert(FormatFields({StringField("path", "a\\b c\nd")}) == R"(path="a\\b c\nd")");
}

void TestUnusableOverrideFallsBackToConfig() {
  runtime::config::RuntimeConfig cfg;
  cfg.mutable_logging()->set_level("debug");
  cfg.mutable_logging()->set_sink("stderr");

  setenv("CLUSTERLINK_LOG_LEVEL", "loud", 1);
  observability::InitializeLogging(cfg);
  unsetenv("CLUSTERLINK_LOG_LEVEL");

  auto logger = spdlog::default_logger();
  assert(logger->name() == "clusterlink");
  assert(logger->level() == spdlog::level::debug);

  setenv("CLUSTERLINK_LOG_LEVEL", "error", 1);
  observability::InitializeLogging(cfg);
  unsetenv("CLUSTERLINK_LOG_LEVEL");
  assert(spdlog::default_logger()->level() == spdlog::level::err);

  CLUSTERLINK_LOG_ERROR("Logging reinitialized", {StringField("reason", "test run")});
}

} // namespace

int main() {
  TestParseLevel();
  TestPlainFieldsAreUnquoted();
  TestAwkwardValuesAreQuoted();
  TestUnusableOverrideFallsBackToConfig();

  observability::ShutdownLogging();
  std::cout << "clusterlink_unit_logging: pass\n";
  return 0;
}
