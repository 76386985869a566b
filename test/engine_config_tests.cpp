#include "engine_config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

namespace {

using qviz::EngineConfig;

class EngineConfigEnvTest : public ::testing::Test {
  protected:
    void TearDown() override {
        for (const char* name : {
                 "QVIZ_MAX_QUBITS",
                 "QVIZ_RENORMALIZE_INTERVAL",
                 "QVIZ_TOLERANCE",
                 "QVIZ_HISTORY_CAPACITY",
                 "QVIZ_SEED",
             }) {
            unsetenv(name);
        }
    }
};

TEST(EngineConfigTests, DefaultsMatchDocumentedValues) {
    const EngineConfig cfg;
    EXPECT_EQ(cfg.max_qubits, 24);
    EXPECT_EQ(cfg.renormalize_interval, 64u);
    EXPECT_DOUBLE_EQ(cfg.tolerance, 1e-9);
    EXPECT_EQ(cfg.history_capacity, 50u);
    EXPECT_TRUE(cfg.emit_logs);
    EXPECT_EQ(cfg.seed, qviz::kUnseeded);
    EXPECT_NO_THROW(cfg.validate());
}

TEST(EngineConfigTests, ValidateRejectsOutOfRangeFields) {
    EngineConfig cfg;
    cfg.max_qubits = qviz::kHardQubitLimit + 1;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = EngineConfig{};
    cfg.max_qubits = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = EngineConfig{};
    cfg.renormalize_interval = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = EngineConfig{};
    cfg.tolerance = 0.0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);

    cfg = EngineConfig{};
    cfg.history_capacity = 0;
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
}

TEST_F(EngineConfigEnvTest, ReadsOverridesFromEnvironment) {
    setenv("QVIZ_MAX_QUBITS", "12", 1);
    setenv("QVIZ_RENORMALIZE_INTERVAL", "8", 1);
    setenv("QVIZ_TOLERANCE", "1e-6", 1);
    setenv("QVIZ_HISTORY_CAPACITY", "5", 1);
    setenv("QVIZ_SEED", "777", 1);

    const EngineConfig cfg = EngineConfig::from_environment();
    EXPECT_EQ(cfg.max_qubits, 12);
    EXPECT_EQ(cfg.renormalize_interval, 8u);
    EXPECT_DOUBLE_EQ(cfg.tolerance, 1e-6);
    EXPECT_EQ(cfg.history_capacity, 5u);
    EXPECT_EQ(cfg.seed, 777u);
}

TEST_F(EngineConfigEnvTest, MalformedValuesFallBackToBase) {
    setenv("QVIZ_MAX_QUBITS", "lots", 1);
    setenv("QVIZ_RENORMALIZE_INTERVAL", "0", 1);
    setenv("QVIZ_TOLERANCE", "abc", 1);
    setenv("QVIZ_HISTORY_CAPACITY", "", 1);

    EngineConfig base;
    base.max_qubits = 10;
    const EngineConfig cfg = EngineConfig::from_environment(base);
    EXPECT_EQ(cfg.max_qubits, 10);
    EXPECT_EQ(cfg.renormalize_interval, 64u);
    EXPECT_DOUBLE_EQ(cfg.tolerance, 1e-9);
    EXPECT_EQ(cfg.history_capacity, 50u);
    EXPECT_NO_THROW(cfg.validate());
}

TEST_F(EngineConfigEnvTest, QubitCeilingCannotExceedHardLimit) {
    setenv("QVIZ_MAX_QUBITS", "31", 1);
    const EngineConfig cfg = EngineConfig::from_environment();
    EXPECT_EQ(cfg.max_qubits, 24);
}

TEST_F(EngineConfigEnvTest, ValuesThatDoNotFitAreIgnored) {
    // 2^32 + 24 would wrap to 24 in a 32-bit int.
    setenv("QVIZ_MAX_QUBITS", "4294967320", 1);
    setenv("QVIZ_HISTORY_CAPACITY", "-1", 1);
    setenv("QVIZ_SEED", "99999999999999999999999", 1);

    EngineConfig base;
    base.max_qubits = 10;
    base.seed = 5;
    const EngineConfig cfg = EngineConfig::from_environment(base);
    EXPECT_EQ(cfg.max_qubits, 10);
    EXPECT_EQ(cfg.history_capacity, 50u);
    EXPECT_EQ(cfg.seed, 5u);

    const EngineConfig defaults = EngineConfig::from_environment();
    EXPECT_EQ(defaults.max_qubits, 24);
    EXPECT_EQ(defaults.seed, qviz::kUnseeded);
}

}  // namespace
