#include "catalog/PartResolver.hpp"

#include <algorithm>

namespace catalog {

static const char* kSource = "PartResolver";

void PartResolver::resolve_into(PartId part, std::vector<PartId>& stack, std::vector<Resolved>& out) {
    const SchematicPart& sp = m_catalog.part(part);

    if (std::find(stack.begin(), stack.end(), part) != stack.end()) {
        throw std::runtime_error("alias cycle through '" + part_name(sp).full + "'");
    }

    if (std::get_if<ChoicePart>(&sp)) {
        out.push_back(Resolved{part, std::nullopt});
        return;
    }

    if (const auto* alias = std::get_if<AliasPart>(&sp)) {
        stack.push_back(part);
        for (const auto& t : alias->targets) {
            const auto target = m_catalog.lookup(t.name);
            if (!target) {
                m_diag.warn(kSource, "unresolved_schematic_part",
                            "part '" + t.name + "' not found for alias '" + alias->name.full + "'",
                            t.name);
                continue;
            }
            for (int i = 0; i < t.count; ++i) resolve_into(*target, stack, out);
        }
        stack.pop_back();
        return;
    }

    const auto& frac = std::get<FractionalPart>(sp);
    const auto base = m_catalog.lookup(frac.choice_part_name);
    if (!base) {
        m_diag.warn(kSource, "unresolved_schematic_part",
                    "whole part '" + frac.choice_part_name + "' not found for fractional part '" +
                        frac.name.full + "'",
                    frac.choice_part_name);
        return;
    }
    if (!std::get_if<ChoicePart>(&m_catalog.part(*base))) {
        throw std::runtime_error("fractional part '" + frac.name.full + "' refers to '" +
                                 frac.choice_part_name + "' which is not a choice part");
    }

    auto& fracs = m_usage[*base].fractional_parts;
    if (std::find(fracs.begin(), fracs.end(), part) == fracs.end()) fracs.push_back(part);

    out.push_back(Resolved{*base, part});
}

std::vector<PartId> PartResolver::resolve(PartId part) {
    std::vector<PartId> stack;
    std::vector<Resolved> resolved;
    resolve_into(part, stack, resolved);

    std::vector<PartId> out;
    out.reserve(resolved.size());
    for (const auto& r : resolved) out.push_back(r.choice);
    return out;
}

std::vector<PartId> PartResolver::resolve_board_part(size_t board_part, int board_count, PartId part) {
    std::vector<PartId> stack;
    std::vector<Resolved> resolved;
    resolve_into(part, stack, resolved);

    std::vector<PartId> out;
    out.reserve(resolved.size());
    for (const auto& r : resolved) {
        m_usage[r.choice].draws.push_back(PartDraw{board_part, board_count, r.fractional});
        out.push_back(r.choice);
    }
    return out;
}

const ChoiceUsage* PartResolver::usage(PartId choice_part) const {
    auto it = m_usage.find(choice_part);
    if (it == m_usage.end()) return nullptr;
    return &it->second;
}

int PartResolver::required_quantity(PartId choice_part) const {
    const ChoiceUsage* u = usage(choice_part);
    if (!u) return 0;

    int count = 0;
    if (u->fractional_parts.empty()) {
        for (const auto& d : u->draws) count += d.board_count;
        return count;
    }

    const auto& first = std::get<FractionalPart>(m_catalog.part(u->fractional_parts.front()));
    const int denominator = first.denominator;
    for (size_t i = 1; i < u->fractional_parts.size(); ++i) {
        const auto& f = std::get<FractionalPart>(m_catalog.part(u->fractional_parts[i]));
        if (f.denominator != denominator) {
            throw FractionalDenominatorError(
                "'" + first.name.full + "' has a denominator of " + std::to_string(denominator) +
                " and '" + f.name.full + "' has one of " + std::to_string(f.denominator));
        }
    }

    // Pack the pieces into whole units in draw order; a piece never spans two units.
    int numerator = 0;
    for (const auto& d : u->draws) {
        int piece = denominator;  // a direct reference consumes a whole unit
        if (d.fractional) piece = std::get<FractionalPart>(m_catalog.part(*d.fractional)).numerator;

        for (int i = 0; i < d.board_count; ++i) {
            if (numerator + piece > denominator) {
                ++count;
                numerator = 0;
            }
            numerator += piece;
        }
    }
    if (numerator > 0) ++count;

    return count;
}

}  // namespace catalog
