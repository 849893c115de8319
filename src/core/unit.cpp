#include "unit.hpp"
#include "size_metadata.hpp"
#include "constants.hpp"
#include <algorithm>
#include <regex>
#include <system_error>

static const std::regex GSE_RE("GSE\\d+");
static const std::regex GSM_RE("GSM\\d+");

int64_t total_bytes(const std::vector<RawInput>& inputs) {
    int64_t total = 0;
    for (const auto& in : inputs) total += in.size;
    return total;
}

bool parse_unit_key(const std::string& key, std::string& collection,
                    std::string& species, std::string& name) {
    fs::path p(key);
    auto gsm = p.filename().string();
    auto sp = p.parent_path().filename().string();
    auto gse = p.parent_path().parent_path().filename().string();
    if (!std::regex_match(gsm, GSM_RE) || !std::regex_match(gse, GSE_RE) || sp.empty()) {
        return false;
    }
    collection = gse;
    species = sp;
    name = gsm;
    return true;
}

Unit make_unit(const fs::path& top_outdir, const fs::path& unit_dir) {
    Unit unit;
    unit.outdir = unit_dir;
    unit.key = fs::relative(unit_dir, top_outdir).generic_string();
    parse_unit_key(unit.key, unit.collection, unit.species, unit.name);

    auto info = read_size_info(unit_dir / SRA_INFO_FILE);
    if (info.is_ok()) {
        unit.raw_inputs = info.value;
    }
    return unit;
}

std::vector<Unit> discover_units(const fs::path& top_outdir) {
    std::vector<Unit> units;
    std::error_code ec;
    if (!fs::is_directory(top_outdir, ec)) return units;

    // Only three levels deep: GSE/species/GSM
    for (const auto& gse : fs::directory_iterator(top_outdir, ec)) {
        if (!gse.is_directory() || !std::regex_match(gse.path().filename().string(), GSE_RE)) continue;
        for (const auto& species : fs::directory_iterator(gse.path(), ec)) {
            if (!species.is_directory()) continue;
            for (const auto& gsm : fs::directory_iterator(species.path(), ec)) {
                if (!gsm.is_directory() || !std::regex_match(gsm.path().filename().string(), GSM_RE)) continue;
                units.push_back(make_unit(top_outdir, gsm.path()));
            }
        }
    }

    std::sort(units.begin(), units.end(),
              [](const Unit& a, const Unit& b) { return a.key < b.key; });
    return units;
}
