// ENDOW Daemon - Main Entry Point
// Copyright (c) 2026 ENDOW Developers
// MIT License
//
// The endowd daemon is the scheduler of the vault engine. It:
// - Builds every vault declared in endow.conf
// - Restores vault state from the vault database
// - Polls each treasury and donation forwarder and performs due upkeep
// - Persists state after every cycle

#include <endow/core/types.h>
#include <endow/db/leveldb.h>
#include <endow/db/vaultdb.h>
#include <endow/util/config.h>
#include <endow/util/logging.h>
#include <endow/util/time.h>
#include <endow/vault/asset_ledger.h>
#include <endow/vault/errors.h>
#include <endow/vault/keeper.h>
#include <endow/vault/params.h>
#include <endow/vault/registry.h>
#include <endow/vault/threshold_math.h>
#include <endow/venue/simulated_venue.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace endow {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "ENDOW Keeper Daemon";

// ============================================================================
// Default Configuration Values
// ============================================================================

namespace defaults {
    constexpr const char* LOG_FILENAME = "keeper.log";
    constexpr const char* DB_DIRNAME = "vaults";

    constexpr int64_t INTERVAL_SECONDS = 60;
    constexpr int64_t REGTEST_INTERVAL_SECONDS = 5;

    /// Seconds per block used to derive block numbers from wall-clock time
    constexpr int64_t BLOCK_TIME = 12;

    /// Owner share of the initial supply; the treasury gets the rest
    constexpr const char* OWNER_SHARE = "0.8";
}

// ============================================================================
// Daemon Configuration
// ============================================================================

struct DaemonConfig {
    std::string network{"main"};  // main, regtest

    std::string dataDir;
    std::string configFile;

    // === Keeper ===
    int64_t interval{0};          // 0 = network default
    bool once{false};
    bool memoryDb{false};

    // === Logging ===
    std::string logLevel;
    std::string logFile;
    int printToConsole{-1};       // -1 = config file decides
    std::vector<std::string> debugCategories;
};

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_shutdown{false};
static DaemonConfig g_config;

// ============================================================================
// Signal Handling
// ============================================================================

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown.store(true);
    }
}

void SetupSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
    std::signal(SIGPIPE, SIG_IGN);
}

// ============================================================================
// Command Line
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: endowd [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  -c, --conf=FILE            Config file path (default: <datadir>/endow.conf)\n";
    std::cout << "  -d, --datadir=DIR          Data directory path\n";
    std::cout << "  --regtest                  Short intervals for local testing\n";
    std::cout << "\nKeeper Options:\n";
    std::cout << "  --interval=SECONDS         Seconds between upkeep polls (default: 60)\n";
    std::cout << "  --once                     Run a single upkeep cycle and exit\n";
    std::cout << "  --memdb                    Keep state in memory only\n";
    std::cout << "\nLogging Options:\n";
    std::cout << "  --debug=CATEGORY           Only log this category below warn (can repeat)\n";
    std::cout << "  --loglevel=LEVEL           Log level: trace, debug, info, warn, error\n";
    std::cout << "  --logfile=FILE             Log file (default: <datadir>/keeper.log)\n";
    std::cout << "  --printtoconsole=0/1       Print to console (default: 1)\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2026 ENDOW Developers\n";
    std::cout << "MIT License\n";
}

/// @return false if the program should exit (help, version or a bad option)
bool ParseCommandLine(int argc, char* argv[], DaemonConfig& config, int& exitCode) {
    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"conf", required_argument, nullptr, 'c'},
        {"datadir", required_argument, nullptr, 'd'},
        {"regtest", no_argument, nullptr, 1001},
        {"interval", required_argument, nullptr, 1002},
        {"once", no_argument, nullptr, 1003},
        {"memdb", no_argument, nullptr, 1004},
        {"debug", required_argument, nullptr, 1005},
        {"loglevel", required_argument, nullptr, 1006},
        {"logfile", required_argument, nullptr, 1007},
        {"printtoconsole", required_argument, nullptr, 1008},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    int optionIndex = 0;
    exitCode = 0;

    while ((opt = getopt_long(argc, argv, "hvc:d:", longOptions, &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                PrintHelp();
                return false;
            case 'v':
                PrintVersion();
                return false;
            case 'c':
                config.configFile = optarg;
                break;
            case 'd':
                config.dataDir = optarg;
                break;
            case 1001:  // --regtest
                config.network = "regtest";
                break;
            case 1002: {  // --interval
                char* end = nullptr;
                long long value = std::strtoll(optarg, &end, 10);
                if (end == optarg || *end != '\0' || value <= 0) {
                    std::cerr << "Error: invalid --interval: " << optarg << "\n";
                    exitCode = 1;
                    return false;
                }
                config.interval = value;
                break;
            }
            case 1003:  // --once
                config.once = true;
                break;
            case 1004:  // --memdb
                config.memoryDb = true;
                break;
            case 1005:  // --debug
                config.debugCategories.push_back(optarg);
                break;
            case 1006:  // --loglevel
                config.logLevel = optarg;
                break;
            case 1007:  // --logfile
                config.logFile = optarg;
                break;
            case 1008: {  // --printtoconsole
                auto value = util::ConfigManager::ParseBool(optarg);
                if (!value) {
                    std::cerr << "Error: invalid --printtoconsole: " << optarg << "\n";
                    exitCode = 1;
                    return false;
                }
                config.printToConsole = *value ? 1 : 0;
                break;
            }
            default:
                std::cerr << "Try 'endowd --help' for more information.\n";
                exitCode = 1;
                return false;
        }
    }
    return true;
}

// ============================================================================
// Configuration File
// ============================================================================

void RegisterConfigKeys(util::ConfigManager& conf) {
    namespace keys = util::ConfigKeys;
    const std::string vaultSections = util::VAULT_SECTION_PREFIX;

    for (const char* key : {keys::DATADIR, keys::LOGLEVEL, keys::LOGFILE, keys::PRINTTOCONSOLE,
                            keys::DEBUG, keys::INTERVAL, keys::NETWORK, keys::SCHEDULER,
                            keys::ADMIN, keys::REGISTRY, keys::VENUE, keys::RATE}) {
        conf.AllowKey(key);
    }

    const char* engineKeys[] = {
        keys::TAXFEE, keys::MAXTREASURY, keys::MINTOPUP, keys::LPFRACTION,
        keys::TRANSFERINTERVAL, keys::MINHEALTH, keys::MINLPHEALTH, keys::TARGETLP,
        keys::SLIPPAGE, keys::MAXBUY, keys::COOLDOWN, keys::BLOCKSTOHOLD, keys::TIMETOHOLD,
    };
    for (const char* key : engineKeys) {
        conf.AllowKey(key);
        conf.AllowKey(key, vaultSections);
    }

    for (const char* key : {keys::OWNER, keys::TOKEN, keys::ASSET, keys::TREASURY, keys::DONATION,
                            keys::GUARD, keys::PAYOUT, keys::FEE, keys::TICKSPACING, keys::SUPPLY,
                            keys::OWNERSHARE, keys::SEEDTOKENS, keys::SEEDASSET}) {
        conf.AllowKey(key, vaultSections);
    }
}

bool InitializeDataDir(DaemonConfig& config) {
    if (config.dataDir.empty()) {
        config.dataDir = util::ConfigManager::GetDefaultDataDir();
    }
    config.dataDir = util::ConfigManager::ExpandTilde(config.dataDir);
    if (config.network == "regtest") {
        config.dataDir = (std::filesystem::path(config.dataDir) / "regtest").string();
    }

    std::error_code ec;
    std::filesystem::create_directories(config.dataDir, ec);
    if (ec && !std::filesystem::is_directory(config.dataDir)) {
        std::cerr << "Error: Cannot create data directory " << config.dataDir
                  << ": " << ec.message() << "\n";
        return false;
    }
    return true;
}

bool LoadConfigFile(DaemonConfig& config, util::ConfigManager& conf) {
    bool explicitFile = !config.configFile.empty();
    if (!explicitFile) {
        config.configFile = (std::filesystem::path(config.dataDir) /
                             util::DEFAULT_CONFIG_FILENAME).string();
    }

    if (!std::filesystem::exists(config.configFile)) {
        if (explicitFile) {
            std::cerr << "Error: Config file not found: " << config.configFile << "\n";
            return false;
        }
        return true;
    }

    util::ConfigParseResult result = conf.ParseFile(config.configFile);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return false;
    }
    for (const auto& warning : result.warnings) {
        std::cerr << "Warning: " << warning << "\n";
    }

    // Command line wins over the file
    if (config.logLevel.empty()) {
        config.logLevel = conf.GetString(util::ConfigKeys::LOGLEVEL, "info");
    }
    if (config.logFile.empty()) {
        config.logFile = conf.GetPath(util::ConfigKeys::LOGFILE);
    }
    if (config.printToConsole < 0) {
        config.printToConsole = conf.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true) ? 1 : 0;
    }
    if (config.interval == 0) {
        config.interval = conf.GetInt(util::ConfigKeys::INTERVAL, 0);
    }
    if (config.network == "main") {
        config.network = conf.GetString(util::ConfigKeys::NETWORK, "main");
    }
    if (auto debug = conf.TryGetString(util::ConfigKeys::DEBUG)) {
        config.debugCategories.push_back(*debug);
    }
    return true;
}

// ============================================================================
// Logging
// ============================================================================

void SetupLogging(const DaemonConfig& config) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(config.logLevel.empty() ? "info" : config.logLevel);
    logger.SetLevel(level);

    if (config.printToConsole != 0) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.useColors = true;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    util::FileSink::Config fileConfig;
    fileConfig.path = config.logFile.empty()
        ? (std::filesystem::path(config.dataDir) / defaults::LOG_FILENAME).string()
        : config.logFile;
    auto fileSink = std::make_shared<util::FileSink>(fileConfig);
    if (fileSink->IsOpen()) {
        logger.AddSink(fileSink);
    } else {
        std::cerr << "Warning: Cannot open log file " << fileConfig.path << "\n";
    }

    for (const auto& category : config.debugCategories) {
        logger.EnableCategory(category);
    }
}

// ============================================================================
// Vault Construction
// ============================================================================

struct SeedAmounts {
    Address owner;
    Amount tokens;
    Amount asset;
};

vault::CallContext MakeContext(const Address& caller) {
    Timestamp now = util::GetTime();
    return vault::CallContext{caller, static_cast<BlockNumber>(now / defaults::BLOCK_TIME), now};
}

/// Read a required address, logging the failure
bool RequireAddress(const util::ConfigManager& conf, const char* key, const std::string& section,
                    Address& out) {
    auto value = conf.TryGetAddress(key, section);
    if (!value || value->IsNull()) {
        std::string where = section.empty() ? key : "[" + section + "] " + key;
        LOG_ERROR(util::LogCategory::DEFAULT) << "Missing or invalid address for " << where;
        return false;
    }
    out = *value;
    return true;
}

/// Build VaultParams for one [vault.<name>] section
bool ReadVaultParams(const util::ConfigManager& conf, const std::string& section,
                     const vault::EngineParams& base, vault::VaultParams& params,
                     SeedAmounts& seed) {
    namespace keys = util::ConfigKeys;

    if (!RequireAddress(conf, keys::OWNER, section, params.owner) ||
        !RequireAddress(conf, keys::TOKEN, section, params.token) ||
        !RequireAddress(conf, keys::TREASURY, section, params.treasury) ||
        !RequireAddress(conf, keys::DONATION, section, params.donation) ||
        !RequireAddress(conf, keys::GUARD, section, params.guard)) {
        return false;
    }

    // Asset defaults to the native currency, payout to the owner
    if (conf.HasKey(keys::ASSET, section)) {
        auto asset = conf.TryGetAddress(keys::ASSET, section);
        if (!asset) {
            LOG_ERROR(util::LogCategory::DEFAULT) << "Invalid address for [" << section << "] asset";
            return false;
        }
        params.asset = *asset;
    }
    params.payout = params.owner;
    if (conf.HasKey(keys::PAYOUT, section) && !RequireAddress(conf, keys::PAYOUT, section, params.payout)) {
        return false;
    }

    int64_t fee = conf.GetInt(keys::FEE, 3000, section);
    int64_t spacing = conf.GetInt(keys::TICKSPACING, 60, section);
    if (fee < 0 || fee > 1000000 || spacing <= 0 || spacing > vault::MAX_TICK) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Invalid fee or tick spacing in [" << section << "]";
        return false;
    }
    params.fee = static_cast<uint32_t>(fee);
    params.tickSpacing = static_cast<int32_t>(spacing);

    auto supply = conf.TryGetAmount(keys::SUPPLY, section);
    auto ownerShare = vault::ParseFraction(conf.GetString(keys::OWNERSHARE, defaults::OWNER_SHARE, section));
    if (!supply || !ownerShare) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Missing or invalid supply/ownershare in [" << section << "]";
        return false;
    }
    params.ownerAllocation = vault::MulFraction(*supply, *ownerShare);
    params.treasuryAllocation = *supply - params.ownerAllocation;

    params.engine = base;
    util::ConfigParseResult applied = vault::ApplyConfig(conf, section, params.engine);
    if (!applied.success) {
        LOG_ERROR(util::LogCategory::DEFAULT) << applied.ToString();
        return false;
    }

    seed.owner = params.owner;
    seed.tokens = conf.TryGetAmount(keys::SEEDTOKENS, section).value_or(Amount(0));
    seed.asset = conf.TryGetAmount(keys::SEEDASSET, section).value_or(Amount(0));
    return true;
}

/// Seed pools of vaults that have none yet
void SeedLiquidity(vault::VaultRegistry& registry, vault::AssetLedger& assets,
                   const std::vector<SeedAmounts>& seeds) {
    vault::CallContext ctx = MakeContext(registry.Roles().admin);
    for (const SeedAmounts& seed : seeds) {
        if (seed.tokens == 0 || seed.asset == 0) {
            continue;
        }
        vault::VaultHandle& handle = registry.GetVault(seed.owner);
        if (handle.Record().isLPCreated) {
            continue;
        }
        assets.Credit(handle.Record().asset, handle.Record().treasury, seed.asset);
        try {
            registry.CreateLiquidity(ctx, seed.owner, seed.tokens, seed.asset);
        } catch (const vault::VaultError& e) {
            LOG_ERROR(util::LogCategory::REGISTRY) << "Seeding liquidity for "
                << seed.owner.ToShortString() << " failed: " << e.what();
        }
    }
}

// ============================================================================
// Keeper Loop
// ============================================================================

void RunKeeper(vault::Keeper& keeper, vault::VaultRegistry& registry,
               vault::AssetLedger& assets, vault::EventLog& events, db::VaultDB& vaultDb,
               int64_t interval, bool once) {
    while (!g_shutdown.load()) {
        Timestamp now = util::GetTime();
        keeper.RunCycle(static_cast<BlockNumber>(now / defaults::BLOCK_TIME), now);

        for (const auto& event : events.Events()) {
            LOG_DEBUG(util::LogCategory::KEEPER) << event.ToString();
        }
        events.Clear();

        db::Status status = vaultDb.WriteState(registry, assets);
        if (!status.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Failed to persist vault state: " << status.ToString();
        }

        if (once) {
            break;
        }
        util::SleepInterruptible(util::Milliseconds(interval * 1000), g_shutdown);
    }
}

// ============================================================================
// Main
// ============================================================================

int AppMain(int argc, char* argv[]) {
    int exitCode = 0;
    if (!ParseCommandLine(argc, argv, g_config, exitCode)) {
        return exitCode;
    }

    if (!InitializeDataDir(g_config)) {
        return 1;
    }

    util::ConfigManager conf;
    RegisterConfigKeys(conf);
    if (!LoadConfigFile(g_config, conf)) {
        return 1;
    }

    SetupLogging(g_config);

    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION << " starting...";
    LOG_INFO(util::LogCategory::DEFAULT) << "Data directory: " << g_config.dataDir;
    LOG_INFO(util::LogCategory::DEFAULT) << "Network: " << g_config.network;

    for (const auto& unknown : conf.Validate()) {
        LOG_WARN(util::LogCategory::DEFAULT) << unknown;
    }

    bool regtest = g_config.network == "regtest";
    if (!regtest && g_config.network != "main") {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Unknown network: " << g_config.network;
        return 1;
    }
    if (g_config.interval <= 0) {
        g_config.interval = regtest ? defaults::REGTEST_INTERVAL_SECONDS : defaults::INTERVAL_SECONDS;
    }

    // ========================================================================
    // Engine
    // ========================================================================

    namespace keys = util::ConfigKeys;

    vault::AccessRoles roles;
    Address venueAddress;
    if (!RequireAddress(conf, keys::ADMIN, "", roles.admin) ||
        !RequireAddress(conf, keys::SCHEDULER, "", roles.scheduler) ||
        !RequireAddress(conf, keys::REGISTRY, "", roles.registry) ||
        !RequireAddress(conf, keys::VENUE, "", venueAddress)) {
        return 1;
    }

    auto rate = conf.HasKey(keys::RATE) ? conf.TryGetAmount(keys::RATE)
                                        : std::optional<Amount>(vault::FRACTION_ONE);
    if (!rate || *rate == 0) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Invalid rate: " << conf.GetString(keys::RATE, "");
        return 1;
    }

    vault::EngineParams base = regtest ? vault::EngineParams::RegTest() : vault::EngineParams::Default();
    util::ConfigParseResult applied = vault::ApplyConfig(conf, "", base);
    if (!applied.success) {
        LOG_ERROR(util::LogCategory::DEFAULT) << applied.ToString();
        return 1;
    }

    auto assets = std::make_shared<vault::AssetLedger>();
    auto events = std::make_shared<vault::EventLog>();
    auto simVenue = std::make_shared<venue::SimulatedVenue>(venueAddress, assets, *rate);

    vault::VaultServices services;
    services.venue = simVenue;
    services.quoter = simVenue;
    services.assets = assets;
    services.events = events;

    vault::VaultRegistry registry(roles, services);

    std::vector<SeedAmounts> seeds;
    for (const auto& name : conf.GetSectionsWithPrefix(util::VAULT_SECTION_PREFIX)) {
        std::string section = util::VAULT_SECTION_PREFIX + name;
        vault::VaultParams params;
        SeedAmounts seed;
        if (!ReadVaultParams(conf, section, base, params, seed)) {
            return 1;
        }
        try {
            vault::VaultHandle& handle = registry.CreateVault(MakeContext(roles.admin), params);
            simVenue->ListToken(handle.Token(), &handle.Guard());
        } catch (const vault::VaultError& e) {
            LOG_ERROR(util::LogCategory::REGISTRY) << "Cannot create vault " << name << ": " << e.what();
            return 1;
        }
        seeds.push_back(seed);
    }

    if (registry.Size() == 0) {
        LOG_WARN(util::LogCategory::DEFAULT) << "No [vault.*] sections configured";
    }

    // ========================================================================
    // State
    // ========================================================================

    std::unique_ptr<db::VaultDB> vaultDb;
    if (g_config.memoryDb) {
        vaultDb = std::make_unique<db::VaultDB>(std::make_unique<db::MemoryDatabase>());
    } else {
        vaultDb = std::make_unique<db::VaultDB>(std::filesystem::path(g_config.dataDir) /
                                                defaults::DB_DIRNAME);
    }

    db::Status status = vaultDb->ReadState(registry, *assets);
    if (status.IsNotFound()) {
        LOG_INFO(util::LogCategory::DB) << "No stored state, starting fresh";
        SeedLiquidity(registry, *assets, seeds);
    } else if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot restore vault state: " << status.ToString();
        return 1;
    }
    events->Clear();

    // ========================================================================
    // Run
    // ========================================================================

    SetupSignalHandlers();

    vault::Keeper keeper(registry, roles.scheduler);
    LOG_INFO(util::LogCategory::KEEPER) << "Servicing " << registry.Size() << " vault(s) every "
                                        << util::FormatDuration(g_config.interval);
    RunKeeper(keeper, registry, *assets, *events, *vaultDb, g_config.interval, g_config.once);

    LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down after " << keeper.Cycles()
                                         << " cycle(s): " << keeper.Totals().ToString();
    util::Logger::Instance().Shutdown();
    return 0;
}

} // namespace endow

int main(int argc, char* argv[]) {
    try {
        return endow::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
