#include "backtest/ledger.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace backtest {
namespace {

constexpr const char* kFormatTag = "chainbt-ledger";

int64_t now_us() {
    using namespace std::chrono;
    return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

LedgerBlock make_genesis_block() {
    LedgerBlock genesis;
    genesis.name = kGenesisBlockName;
    genesis.previous_hash = kGenesisPreviousHash;
    genesis.timestamp_us = 0;
    genesis.hash = compute_block_hash(genesis);
    return genesis;
}

nlohmann::json block_to_json(const LedgerBlock& block) {
    nlohmann::json json;
    json["name"] = block.name;
    json["payload"] = block.payload;
    json["previous_hash"] = block.previous_hash;
    json["timestamp_us"] = block.timestamp_us;
    json["hash"] = block.hash;
    return json;
}

LedgerBlock block_from_json(const nlohmann::json& json) {
    LedgerBlock block;
    block.name = json.at("name").get<std::string>();
    block.payload = json.at("payload").get<std::string>();
    block.previous_hash = json.at("previous_hash").get<std::string>();
    block.timestamp_us = json.at("timestamp_us").get<int64_t>();
    block.hash = json.at("hash").get<std::string>();
    return block;
}

} // namespace

std::string sha256_hex(const std::string& data) {
    unsigned char buffer[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), buffer, &len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to compute SHA-256 digest");
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(buffer[i]);
    }
    return oss.str();
}

std::string compute_block_hash(const LedgerBlock& block) {
    return sha256_hex(std::to_string(block.timestamp_us) + block.name + block.payload + block.previous_hash);
}

Ledger::Ledger(LedgerConfig config)
    : config_(std::move(config)) {
    if (config_.name.empty()) {
        throw std::invalid_argument("Ledger name must not be empty");
    }
    if (config_.name.find_first_of("/\\") != std::string::npos) {
        throw std::invalid_argument("Ledger name must not contain path separators: " + config_.name);
    }
}

std::filesystem::path Ledger::path_for(const LedgerConfig& config) {
    return config.directory / (config.name + ".json");
}

std::filesystem::path Ledger::storage_path() const {
    return path_for(config_);
}

bool Ledger::exists(const LedgerConfig& config) {
    return std::filesystem::exists(path_for(config));
}

Ledger Ledger::create(LedgerConfig config, bool load_existing) {
    if (exists(config)) {
        if (!load_existing) {
            throw DuplicateLedgerError("Ledger '" + config.name + "' already exists at " +
                                       path_for(config).string());
        }
        std::cerr << "[Ledger] Ledger " << config.name << " already exists. Loading it from disk." << std::endl;
        return load(std::move(config));
    }

    Ledger ledger(std::move(config));
    ledger.blocks_.push_back(make_genesis_block());
    ledger.persist();
    std::cout << "[Ledger] Ledger " << ledger.name() << " initialized at " << ledger.storage_path().string() << std::endl;
    return ledger;
}

Ledger Ledger::load(LedgerConfig config) {
    if (!exists(config)) {
        throw LedgerNotFoundError("Ledger '" + config.name + "' not found at " + path_for(config).string());
    }
    Ledger ledger(std::move(config));
    ledger.read_from_disk();
    return ledger;
}

bool Ledger::remove(const LedgerConfig& config) {
    std::error_code ec;
    const bool removed = std::filesystem::remove(path_for(config), ec);
    if (ec) {
        throw LedgerError("Failed to remove ledger " + path_for(config).string() + ": " + ec.message());
    }
    return removed;
}

const LedgerBlock& Ledger::append(const std::string& name, const std::string& payload) {
    LedgerBlock block;
    block.name = name;
    block.payload = payload;
    block.previous_hash = blocks_.empty() ? kGenesisPreviousHash : blocks_.back().hash;
    block.timestamp_us = now_us();
    block.hash = compute_block_hash(block);

    blocks_.push_back(std::move(block));
    try {
        persist();
    } catch (...) {
        blocks_.pop_back();
        throw;
    }
    return blocks_.back();
}

std::size_t Ledger::first_invalid_block() const {
    for (std::size_t i = 1; i < blocks_.size(); ++i) {
        const auto& current = blocks_[i];
        if (current.hash != compute_block_hash(current)) {
            return i;
        }
        if (current.previous_hash != blocks_[i - 1].hash) {
            return i;
        }
    }
    return blocks_.size();
}

bool Ledger::verify() const {
    return first_invalid_block() == blocks_.size();
}

void Ledger::verify_or_throw() const {
    const auto index = first_invalid_block();
    if (index != blocks_.size()) {
        throw LedgerIntegrityError("Ledger '" + config_.name + "' is corrupted at block " + std::to_string(index),
                                   index);
    }
}

std::string Ledger::describe() const {
    const std::string rule(80, '-');
    std::ostringstream oss;
    for (std::size_t i = 0; i < blocks_.size(); ++i) {
        const auto& block = blocks_[i];
        oss << rule << '\n'
            << "Block " << i << '\n'
            << rule << '\n'
            << "Backtest: " << block.name << '\n'
            << "Timestamp: " << block.timestamp_us << '\n'
            << "Hash: " << block.hash << '\n'
            << "Previous Hash: " << block.previous_hash << '\n'
            << rule << '\n';
    }
    return oss.str();
}

void Ledger::ensure_directory() const {
    if (!config_.directory.empty() && !std::filesystem::exists(config_.directory)) {
        std::filesystem::create_directories(config_.directory);
    }
}

void Ledger::persist() const {
    ensure_directory();

    nlohmann::json json;
    json["format"] = kFormatTag;
    json["version"] = kLedgerFormatVersion;
    json["name"] = config_.name;
    json["blocks"] = nlohmann::json::array();
    for (const auto& block : blocks_) {
        json["blocks"].push_back(block_to_json(block));
    }

    const auto path = storage_path();
    auto temp_path = path;
    temp_path += ".tmp";
    {
        std::ofstream output(temp_path, std::ios::trunc);
        if (!output.good()) {
            throw LedgerError("Failed to write ledger at " + temp_path.string());
        }
        output << json.dump(2) << '\n';
        if (!output.good()) {
            throw LedgerError("Failed to write ledger at " + temp_path.string());
        }
    }
    std::filesystem::rename(temp_path, path);
}

void Ledger::read_from_disk() {
    const auto path = storage_path();
    std::ifstream input(path);
    if (!input.good()) {
        throw LedgerNotFoundError("Failed to open ledger at " + path.string());
    }

    try {
        const auto json = nlohmann::json::parse(input);
        if (json.value("format", std::string{}) != kFormatTag) {
            throw LedgerFormatError("File " + path.string() + " is not a ledger");
        }
        const int version = json.value("version", 0);
        if (version != kLedgerFormatVersion) {
            throw LedgerFormatError("Unsupported ledger version " + std::to_string(version) + " in " + path.string());
        }
        std::vector<LedgerBlock> blocks;
        for (const auto& entry : json.at("blocks")) {
            blocks.push_back(block_from_json(entry));
        }
        if (blocks.empty()) {
            throw LedgerFormatError("Ledger " + path.string() + " has no genesis block");
        }
        blocks_ = std::move(blocks);
    } catch (const nlohmann::json::exception& ex) {
        throw LedgerFormatError("Malformed ledger " + path.string() + ": " + ex.what());
    }
}

} // namespace backtest
