#include <tally/ledger/events.h>

namespace tally::ledger {

const char* toString(EventKind kind) {
    switch (kind) {
        case EventKind::Contribution:
            return "contribution";
        case EventKind::QuantityChange:
            return "quantity_change";
    }
    return "unknown";
}

std::optional<EventKind> parseEventKind(std::string_view text) {
    if (text == "contribution")
        return EventKind::Contribution;
    if (text == "quantity_change" || text == "override")
        return EventKind::QuantityChange;
    return std::nullopt;
}

EventKind kindOf(const LedgerEvent& event) {
    return std::holds_alternative<ContributionEvent>(event) ? EventKind::Contribution
                                                            : EventKind::QuantityChange;
}

EventId idOf(const LedgerEvent& event) {
    return std::visit([](const auto& e) { return e.id; }, event);
}

TimePoint occurredAt(const LedgerEvent& event) {
    if (const auto* c = std::get_if<ContributionEvent>(&event))
        return c->createdAt;
    return std::get<QuantityChangeEvent>(event).changedAt;
}

std::int64_t sequenceOf(const LedgerEvent& event) {
    return std::visit([](const auto& e) { return e.sequence; }, event);
}

ItemKey itemKeyOf(const LedgerEvent& event) {
    return std::visit([](const auto& e) { return ItemKey{e.category, e.itemName}; }, event);
}

bool chronologicallyBefore(const LedgerEvent& a, const LedgerEvent& b) {
    auto ta = occurredAt(a);
    auto tb = occurredAt(b);
    if (ta != tb)
        return ta < tb;
    return sequenceOf(a) < sequenceOf(b);
}

bool isValidUtf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t length = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0)
                low = 0xA0; // overlong
            else if (lead == 0xED)
                high = 0x9F; // UTF-16 surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0)
                low = 0x90; // overlong
            else if (lead == 0xF4)
                high = 0x8F; // past U+10FFFF
        } else {
            return false;
        }

        if (text.size() - i < length)
            return false;
        const auto second = static_cast<unsigned char>(text[i + 1]);
        if (second < low || second > high)
            return false;
        for (std::size_t k = 2; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if (next < 0x80 || next > 0xBF)
                return false;
        }
        i += length;
    }
    return true;
}

} // namespace tally::ledger
