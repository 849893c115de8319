#include "size_metadata.hpp"
#include "size_units.hpp"
#include "constants.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <system_error>

Result<std::vector<RawInput>> read_size_info(const fs::path& file) {
    std::error_code ec;
    if (!fs::exists(file, ec)) {
        return Result<std::vector<RawInput>>::Err(ErrorKind::MetadataMissing,
                                                  file.string() + " not found");
    }

    std::vector<RawInput> inputs;
    try {
        YAML::Node root = YAML::LoadFile(file.string());
        if (!root.IsSequence()) {
            return Result<std::vector<RawInput>>::Err(ErrorKind::MetadataMissing,
                                                      file.string() + ": expected a list");
        }
        for (const auto& entry : root) {
            if (!entry.IsMap()) continue;
            for (const auto& kv : entry) {
                RawInput in;
                in.path = kv.first.as<std::string>();
                if (!kv.second["size"]) {
                    return Result<std::vector<RawInput>>::Err(
                        ErrorKind::MetadataMissing,
                        file.string() + ": no size for " + in.path);
                }
                in.size = kv.second["size"].as<int64_t>();
                in.readable_size = kv.second["readable_size"].as<std::string>("");
                if (in.size < 0) {
                    return Result<std::vector<RawInput>>::Err(
                        ErrorKind::MetadataMissing,
                        file.string() + ": negative size for " + in.path);
                }
                inputs.push_back(in);
            }
        }
    } catch (const std::exception& e) {
        return Result<std::vector<RawInput>>::Err(ErrorKind::MetadataMissing,
                                                  file.string() + ": " + e.what());
    }

    return Result<std::vector<RawInput>>::Ok(inputs);
}

Result<void> write_size_info(const fs::path& file, const std::vector<RawInput>& inputs) {
    YAML::Emitter out;
    out << YAML::BeginSeq;
    for (const auto& in : inputs) {
        out << YAML::BeginMap;
        out << YAML::Key << in.path << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "readable_size" << YAML::Value
            << (in.readable_size.empty() ? format_size(static_cast<double>(in.size)) : in.readable_size);
        out << YAML::Key << "size" << YAML::Value << in.size;
        out << YAML::EndMap;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    std::ofstream fout(file);
    if (!fout) {
        return Result<void>::Err(ErrorKind::IoFailed, "Cannot write " + file.string());
    }
    fout << out.c_str() << "\n";
    return Result<void>::Ok();
}

std::vector<RawInput> scan_fastq_gz(const fs::path& unit_dir) {
    std::vector<RawInput> found;
    std::error_code ec;
    const std::string suffix = FASTQ_GZ_SUFFIX;
    for (const auto& entry : fs::directory_iterator(unit_dir, ec)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (name.size() <= suffix.size() ||
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        RawInput in;
        in.path = name;
        in.size = static_cast<int64_t>(entry.file_size());
        in.readable_size = format_size(static_cast<double>(in.size));
        found.push_back(in);
    }
    std::sort(found.begin(), found.end(),
              [](const RawInput& a, const RawInput& b) { return a.path < b.path; });
    return found;
}

Result<int64_t> fastq_gz_total(const fs::path& unit_dir, bool* created) {
    if (created) *created = false;
    std::error_code ec;
    if (!fs::is_directory(unit_dir, ec)) {
        return Result<int64_t>::Err(ErrorKind::MetadataMissing,
                                    unit_dir.string() + " does not exist locally");
    }

    fs::path info_file = unit_dir / FQ_GZ_INFO_FILE;
    if (!fs::exists(info_file, ec)) {
        auto written = write_size_info(info_file, scan_fastq_gz(unit_dir));
        if (written.is_err()) {
            return Result<int64_t>::Err(written.kind, written.error);
        }
        if (created) *created = true;
    }

    auto info = read_size_info(info_file);
    if (info.is_err()) {
        return Result<int64_t>::Err(info.kind, info.error);
    }
    return Result<int64_t>::Ok(total_bytes(info.value));
}
