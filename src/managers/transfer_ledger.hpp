#pragma once

#include <set>
#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

// Append-only record of unit keys already moved to the remote host
// (<top>/transferred_GSMs.txt). Each append starts with a
// "# yy-mm-dd HH:MM:SS" comment line. Lines are never rewritten.
class TransferLedger {
public:
    explicit TransferLedger(const std::filesystem::path& file);

    // Keys recorded so far. A missing file is an empty ledger.
    Result<std::set<std::string>> read() const;

    Result<void> append(const std::vector<std::string>& keys);

    const std::filesystem::path& path() const { return file_; }

private:
    std::filesystem::path file_;
};
