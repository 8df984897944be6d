#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace catalog {

using PartId = std::size_t;        // index into PartCatalog schematic part arena
using ActualPartId = std::size_t;  // index into PartCatalog actual part arena

struct PriceBreak {
    int min_quantity = 0;
    double unit_price = 0.0;
};

struct ActualPartKey {
    std::string manufacturer_name;
    std::string manufacturer_part_name;

    bool operator==(const ActualPartKey& o) const {
        return manufacturer_name == o.manufacturer_name &&
               manufacturer_part_name == o.manufacturer_part_name;
    }
    bool operator!=(const ActualPartKey& o) const { return !(*this == o); }
    bool operator<(const ActualPartKey& o) const {
        if (manufacturer_name != o.manufacturer_name) return manufacturer_name < o.manufacturer_name;
        return manufacturer_part_name < o.manufacturer_part_name;
    }
};

std::string to_string(const ActualPartKey& key);

struct VendorQuote {
    ActualPartKey actual_part_key;    // owning actual part
    std::string vendor_name;
    std::string vendor_part_name;
    int available_quantity = 0;
    std::vector<PriceBreak> price_breaks;  // min_quantity ascending
    std::int64_t fetched_at = 0;           // epoch seconds
};

struct ActualPart {
    ActualPartKey key;
    std::vector<VendorQuote> quotes;
};

// "<base_name>;<short_footprint>[:comment]"
struct PartName {
    std::string full;
    std::string base_name;
    std::string short_footprint;
    std::string comment;
};

struct Placement {
    double rotation = 0.0;
    double pick_dx = 0.0;
    double pick_dy = 0.0;
    double part_height = 0.0;
    std::string feeder_name;
};

struct ChoicePart {
    PartName name;
    std::string footprint;     // full footprint identifier
    std::string description;
    Placement placement;

    // filled by PartCatalog::deduplicate_actual_parts(), declaration order
    std::vector<ActualPartId> actual_part_ids;
};

struct AliasTarget {
    int count = 1;
    std::string name;
};

struct AliasPart {
    PartName name;
    std::string footprint;
    Placement placement;
    std::vector<AliasTarget> targets;
};

struct FractionalPart {
    PartName name;
    std::string footprint;
    std::string choice_part_name;
    int numerator = 1;
    int denominator = 1;
    std::string description;
};

using SchematicPart = std::variant<ChoicePart, AliasPart, FractionalPart>;

const PartName& part_name(const SchematicPart& part);
const char* part_kind_str(const SchematicPart& part);

}  // namespace catalog
