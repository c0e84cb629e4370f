#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace backtest {

class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DuplicateLedgerError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

class LedgerNotFoundError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

class LedgerFormatError : public LedgerError {
public:
    using LedgerError::LedgerError;
};

class LedgerIntegrityError : public LedgerError {
public:
    LedgerIntegrityError(const std::string& message, std::size_t block_index)
        : LedgerError(message), block_index_(block_index) {}

    [[nodiscard]] std::size_t block_index() const noexcept { return block_index_; }

private:
    std::size_t block_index_;
};

struct LedgerConfig {
    std::filesystem::path directory = "blockchain";
    std::string name = "backtest";
};

struct LedgerBlock {
    std::string name;
    std::string payload;
    std::string previous_hash;
    int64_t timestamp_us = 0;
    std::string hash;
};

inline constexpr const char* kGenesisBlockName = "Genesis Block";
inline constexpr const char* kGenesisPreviousHash = "0";
inline constexpr int kLedgerFormatVersion = 1;

std::string sha256_hex(const std::string& data);

// SHA-256 over timestamp || name || payload || previous_hash.
std::string compute_block_hash(const LedgerBlock& block);

// Append-only hash chain of backtest runs, one JSON file per chain name.
// Every append rewrites the whole file; chains hold one block per run.
class Ledger {
public:
    // Starts a chain with the genesis block. An existing chain is loaded when
    // `load_existing` is set, otherwise DuplicateLedgerError is thrown.
    static Ledger create(LedgerConfig config, bool load_existing = false);
    static Ledger load(LedgerConfig config);
    static bool exists(const LedgerConfig& config);
    // Deletes the chain file; returns false when there was nothing to delete.
    static bool remove(const LedgerConfig& config);

    const LedgerBlock& append(const std::string& name, const std::string& payload);

    [[nodiscard]] bool verify() const;
    void verify_or_throw() const;

    [[nodiscard]] const std::vector<LedgerBlock>& blocks() const { return blocks_; }
    [[nodiscard]] const std::string& name() const { return config_.name; }
    [[nodiscard]] std::filesystem::path storage_path() const;

    std::string describe() const;

private:
    explicit Ledger(LedgerConfig config);

    static std::filesystem::path path_for(const LedgerConfig& config);

    void ensure_directory() const;
    void persist() const;
    void read_from_disk();
    std::size_t first_invalid_block() const;

    LedgerConfig config_;
    std::vector<LedgerBlock> blocks_;
};

} // namespace backtest
