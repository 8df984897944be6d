#include "catalog/PartCatalog.hpp"

#include "catalog/PartName.hpp"

#include <stdexcept>
#include <utility>

namespace catalog {

static const char* kSource = "PartCatalog";

PartId PartCatalog::insert(SchematicPart part) {
    const std::string& name = part_name(part).full;

    auto it = m_by_name.find(name);
    if (it != m_by_name.end()) {
        m_diag.warn(kSource, "duplicate_registration",
                    "'" + name + "' is registered more than once (" + part_kind_str(part) +
                        " ignored, keeping " + part_kind_str(m_parts[it->second]) + ")",
                    name);
        return it->second;
    }

    const PartId id = m_parts.size();
    m_by_name.emplace(name, id);
    m_parts.push_back(std::move(part));
    return id;
}

PartId PartCatalog::register_choice_part(ChoicePartDef def) {
    ChoicePart cp;
    cp.name = parse_part_name(def.name);
    cp.footprint = std::move(def.footprint);
    cp.description = std::move(def.description);
    cp.placement = std::move(def.placement);

    const size_t before = m_parts.size();
    const PartId id = insert(std::move(cp));
    if (m_parts.size() != before) {
        m_pending.emplace_back(id, std::move(def.actual_parts));
    }
    return id;
}

PartId PartCatalog::register_alias_part(AliasPartDef def) {
    AliasPart ap;
    ap.name = parse_part_name(def.name);
    ap.footprint = std::move(def.footprint);
    ap.placement = std::move(def.placement);

    for (const auto& t : def.targets) {
        if (t.count < 1) {
            throw std::invalid_argument("alias '" + def.name + "' has count " +
                                        std::to_string(t.count) + " for target '" + t.name + "'");
        }
    }
    ap.targets = std::move(def.targets);

    return insert(std::move(ap));
}

PartId PartCatalog::register_fractional_part(FractionalPartDef def) {
    if (def.denominator <= 0 || def.numerator <= 0 || def.numerator > def.denominator) {
        throw std::invalid_argument("fractional part '" + def.name + "' has invalid fraction " +
                                    std::to_string(def.numerator) + "/" +
                                    std::to_string(def.denominator));
    }

    FractionalPart fp;
    fp.name = parse_part_name(def.name);
    fp.footprint = std::move(def.footprint);
    fp.choice_part_name = std::move(def.choice_part_name);
    fp.numerator = def.numerator;
    fp.denominator = def.denominator;
    fp.description = std::move(def.description);

    return insert(std::move(fp));
}

std::optional<PartId> PartCatalog::lookup(const std::string& name) const {
    auto it = m_by_name.find(name);
    if (it == m_by_name.end()) return std::nullopt;
    return it->second;
}

void PartCatalog::deduplicate_actual_parts() {
    for (auto& pending : m_pending) {
        ChoicePart& cp = std::get<ChoicePart>(m_parts[pending.first]);

        for (auto& ap : pending.second) {
            auto it = m_actual_by_key.find(ap.key);
            if (it != m_actual_by_key.end()) {
                m_diag.warn(kSource, "duplicate_actual_part",
                            "actual part " + to_string(ap.key) + " of '" + cp.name.full +
                                "' is already in the catalog; keeping the first instance",
                            cp.name.full);

                bool listed = false;
                for (ActualPartId id : cp.actual_part_ids) {
                    if (id == it->second) listed = true;
                }
                if (!listed) cp.actual_part_ids.push_back(it->second);
                continue;
            }

            const ActualPartId id = m_actual_parts.size();
            for (auto& q : ap.quotes) q.actual_part_key = ap.key;
            m_actual_by_key.emplace(ap.key, id);
            m_actual_parts.push_back(std::move(ap));
            cp.actual_part_ids.push_back(id);
        }
    }
    m_pending.clear();
}

std::optional<ActualPartId> PartCatalog::find_actual_part(const ActualPartKey& key) const {
    auto it = m_actual_by_key.find(key);
    if (it == m_actual_by_key.end()) return std::nullopt;
    return it->second;
}

int PartCatalog::add_quotes(ActualPartId id, const std::vector<VendorQuote>& quotes) {
    ActualPart& ap = m_actual_parts.at(id);

    int added = 0;
    for (const auto& q : quotes) {
        bool present = false;
        for (const auto& existing : ap.quotes) {
            if (existing.vendor_name == q.vendor_name && existing.vendor_part_name == q.vendor_part_name) {
                present = true;
                break;
            }
        }
        if (present) continue;

        VendorQuote copy = q;
        copy.actual_part_key = ap.key;
        ap.quotes.push_back(std::move(copy));
        ++added;
    }
    return added;
}

}  // namespace catalog
