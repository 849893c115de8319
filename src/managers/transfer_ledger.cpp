#include "transfer_ledger.hpp"
#include <core/utils.hpp>
#include <fstream>
#include <system_error>

TransferLedger::TransferLedger(const std::filesystem::path& file) : file_(file) {}

Result<std::set<std::string>> TransferLedger::read() const {
    std::set<std::string> keys;
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        return Result<std::set<std::string>>::Ok(keys);
    }

    std::ifstream in(file_);
    if (!in) {
        return Result<std::set<std::string>>::Err(ErrorKind::IoFailed,
                                                   "Cannot read " + file_.string());
    }
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;
        keys.insert(line);
    }
    return Result<std::set<std::string>>::Ok(keys);
}

Result<void> TransferLedger::append(const std::vector<std::string>& keys) {
    if (keys.empty()) return Result<void>::Ok();

    std::ofstream out(file_, std::ios::app);
    if (!out) {
        return Result<void>::Err(ErrorKind::IoFailed, "Cannot append to " + file_.string());
    }
    out << "# " << now_ledger_stamp() << "\n";
    for (const auto& k : keys) out << k << "\n";
    out.flush();
    if (!out) {
        return Result<void>::Err(ErrorKind::IoFailed, "Failed writing " + file_.string());
    }
    return Result<void>::Ok();
}
