#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>

namespace fs = std::filesystem;

// One raw input of a unit (an .sra run, or a .fastq.gz on the transfer side)
struct RawInput {
    std::string path;               // relative to the unit directory, e.g. SRX0/SRR0/SRR0.sra
    int64_t size = 0;               // bytes
    std::string readable_size;      // cached "2.4 GB"

    std::string basename() const { return fs::path(path).filename().string(); }
};

// One sample (GSM) directory: <top>/<GSE>/<species>/<GSM>
struct Unit {
    std::string key;                // "GSE42735/homo_sapiens/GSM1048945", stable and unique
    std::string collection;         // "GSE42735"
    std::string species;            // "homo_sapiens"
    std::string name;               // "GSM1048945"
    fs::path outdir;

    // nullopt when sras_info.yaml is absent or unreadable
    std::optional<std::vector<RawInput>> raw_inputs;
};

// Sum of raw input sizes
int64_t total_bytes(const std::vector<RawInput>& inputs);

// Split a "GSE.../species/GSM..." key. Returns false when the path does not
// look like a unit directory.
bool parse_unit_key(const std::string& key, std::string& collection,
                    std::string& species, std::string& name);

// Build a Unit from a directory under top_outdir, loading sras_info.yaml if present.
Unit make_unit(const fs::path& top_outdir, const fs::path& unit_dir);

// Walk top_outdir for <GSE\d+>/<species>/<GSM\d+> directories.
// Returned in lexicographic key order.
std::vector<Unit> discover_units(const fs::path& top_outdir);
