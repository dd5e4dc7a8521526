#include "tv_config.h"

#include <QJsonArray>
#include <QJsonObject>

#include <gtest/gtest.h>

using namespace phicore::samsungtv::ipc;

// ============================================================
// Setting readers
// ============================================================

TEST(ConfigSettings, IntAcceptsNumbersAndNumericStrings)
{
    const QJsonObject meta {
        { QStringLiteral("a"), 42 },
        { QStringLiteral("b"), QStringLiteral(" 17 ") },
        { QStringLiteral("c"), QStringLiteral("abc") },
        { QStringLiteral("d"), -5 },
    };
    EXPECT_EQ(readIntSetting(meta, QStringLiteral("a"), 1), 42);
    EXPECT_EQ(readIntSetting(meta, QStringLiteral("b"), 1), 17);
    EXPECT_EQ(readIntSetting(meta, QStringLiteral("c"), 1), 1);
    EXPECT_EQ(readIntSetting(meta, QStringLiteral("d"), 1), 1);
    EXPECT_EQ(readIntSetting(meta, QStringLiteral("missing"), 9), 9);
}

TEST(ConfigSettings, BoolAcceptsCommonSpellings)
{
    const QJsonObject meta {
        { QStringLiteral("a"), true },
        { QStringLiteral("b"), QStringLiteral("false") },
        { QStringLiteral("c"), 1 },
        { QStringLiteral("d"), QStringLiteral("maybe") },
    };
    EXPECT_TRUE(readBoolSetting(meta, QStringLiteral("a"), false));
    EXPECT_FALSE(readBoolSetting(meta, QStringLiteral("b"), true));
    EXPECT_TRUE(readBoolSetting(meta, QStringLiteral("c"), false));
    EXPECT_TRUE(readBoolSetting(meta, QStringLiteral("d"), true));
}

// ============================================================
// EngineConfig::fromMeta
// ============================================================

TEST(EngineConfigTest, EmptyMetaUsesDefaults)
{
    const EngineConfig cfg = EngineConfig::fromMeta({});
    EXPECT_EQ(cfg.pollIntervalSec, 30);
    EXPECT_FALSE(cfg.autoScan);
    EXPECT_EQ(cfg.autoScanIntervalSec, 300);
    EXPECT_EQ(cfg.discoveryTimeoutSec, 5);
    EXPECT_TRUE(cfg.enableSsdp);
    EXPECT_TRUE(cfg.enableMdns);
    EXPECT_TRUE(cfg.enableWol);
    EXPECT_EQ(cfg.clientName, QStringLiteral("phi-core"));
    EXPECT_EQ(cfg.mdnsServices, QStringLiteral("_samsungmsf._tcp"));
    EXPECT_TRUE(cfg.devices.isEmpty());
    EXPECT_TRUE(cfg.deviceTrees.isEmpty());
}

TEST(EngineConfigTest, ClampsIntervals)
{
    const QJsonObject meta {
        { QStringLiteral("pollInterval"), 3 },
        { QStringLiteral("autoScanInterval"), 10 },
        { QStringLiteral("discoveryTimeout"), 1 },
    };
    const EngineConfig cfg = EngineConfig::fromMeta(meta);
    EXPECT_EQ(cfg.pollIntervalSec, 10);
    EXPECT_EQ(cfg.autoScanIntervalSec, 30);
    EXPECT_EQ(cfg.discoveryTimeoutSec, 2);
}

TEST(EngineConfigTest, ReadsDevicesTokensAndTrees)
{
    QJsonArray devices;
    devices.append(QJsonObject { { QStringLiteral("id"), QStringLiteral("abc") } });
    const QJsonObject meta {
        { QStringLiteral("devices"), devices },
        { QStringLiteral("tokens"), QStringLiteral("{\"tizen\":{}}") },
        { QStringLiteral("clientName"), QStringLiteral("  den  ") },
        { QStringLiteral("deviceTrees"),
          QJsonObject {
              { QStringLiteral("living"), QStringLiteral("abc") },
              { QStringLiteral("broken"), QString() },
          } },
    };
    const EngineConfig cfg = EngineConfig::fromMeta(meta);
    EXPECT_EQ(cfg.devices.size(), 1);
    EXPECT_EQ(cfg.tokens, QStringLiteral("{\"tizen\":{}}"));
    EXPECT_EQ(cfg.clientName, QStringLiteral("den"));
    EXPECT_EQ(cfg.deviceTrees.size(), 1);
    EXPECT_EQ(cfg.deviceTrees.value(QStringLiteral("living")), QStringLiteral("abc"));
}
