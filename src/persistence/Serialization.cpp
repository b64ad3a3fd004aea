#include "persistence/Serialization.hpp"
#include "core/Types.hpp"

#include <charconv>
#include <sstream>
#include <system_error>
#include <vector>

namespace sweeper::persistence {

using core::SavedCell;
using core::SavedGame;

// Per-cell bit set written in ROW lines
namespace {
    constexpr int kMineBit     = 1;
    constexpr int kTreasureBit = 2;
    constexpr int kFlaggedBit  = 4;
    constexpr int kRevealedBit = 8;

    int encodeCell(const SavedCell& cell) {
        int code = 0;
        if (cell.isMine)      code |= kMineBit;
        if (cell.hasTreasure) code |= kTreasureBit;
        if (cell.isFlagged)   code |= kFlaggedBit;
        if (cell.isRevealed)  code |= kRevealedBit;
        return code;
    }

    SavedCell decodeCell(int code) {
        SavedCell cell;
        cell.isMine      = (code & kMineBit) != 0;
        cell.hasTreasure = (code & kTreasureBit) != 0;
        cell.isFlagged   = (code & kFlaggedBit) != 0;
        cell.isRevealed  = (code & kRevealedBit) != 0;
        return cell;
    }

    std::vector<std::string> splitFields(const std::string& line) {
        std::vector<std::string> fields;
        std::istringstream is(line);
        std::string field;
        while (std::getline(is, field, ';')) {
            fields.push_back(field);
        }
        return fields;
    }

    std::optional<long long> toInteger(const std::string& s) {
        long long value = 0;
        const char* first = s.data();
        const char* last = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc{} || ptr != last || s.empty()) {
            return std::nullopt;
        }
        return value;
    }
}

std::string serialize(const SavedGame& saved)
{
    std::ostringstream os;

    os << "SWEEPER_SAVE;" << saved.version << '\n';
    os << "SIZE;" << saved.rows << ';' << saved.cols << ';'
       << (saved.fixedLayout ? 1 : 0) << '\n';

    os << "COUNTERS;" << saved.clickedCount << ';' << saved.flagCount << ';';
    if (saved.startedAtMs) {
        os << *saved.startedAtMs;
    } else {
        os << '-';
    }
    os << '\n';

    for (int r = 0; r < saved.rows; ++r) {
        os << "ROW";
        for (int c = 0; c < saved.cols; ++c) {
            const auto index = static_cast<std::size_t>(r * saved.cols + c);
            const int code = index < saved.cells.size() ? encodeCell(saved.cells[index]) : 0;
            os << ';' << code;
        }
        os << '\n';
    }

    return os.str();
}

std::optional<SavedGame> deserialize(const std::string& text)
{
    std::istringstream is(text);
    std::string line;

    SavedGame saved{};

    // Header
    if (!std::getline(is, line)) return std::nullopt;
    auto header = splitFields(line);
    if (header.size() != 2 || header[0] != "SWEEPER_SAVE") return std::nullopt;
    auto version = toInteger(header[1]);
    if (!version || *version != SavedGame::kFormatVersion) return std::nullopt;
    saved.version = static_cast<std::uint32_t>(*version);

    // SIZE;rows;cols;fixed
    if (!std::getline(is, line)) return std::nullopt;
    auto size = splitFields(line);
    if (size.size() != 4 || size[0] != "SIZE") return std::nullopt;
    auto rows = toInteger(size[1]);
    auto cols = toInteger(size[2]);
    auto fixed = toInteger(size[3]);
    if (!rows || !cols || !fixed) return std::nullopt;
    if (*rows <= 0 || *cols <= 0) return std::nullopt;
    if (*rows > core::kMaxBoardSide || *cols > core::kMaxBoardSide) return std::nullopt;
    if (*fixed != 0 && *fixed != 1) return std::nullopt;
    saved.rows = static_cast<int>(*rows);
    saved.cols = static_cast<int>(*cols);
    saved.fixedLayout = (*fixed == 1);

    // COUNTERS;clicked;flags;startedAtMs|-
    if (!std::getline(is, line)) return std::nullopt;
    auto counters = splitFields(line);
    if (counters.size() != 4 || counters[0] != "COUNTERS") return std::nullopt;
    auto clicked = toInteger(counters[1]);
    auto flags = toInteger(counters[2]);
    if (!clicked || !flags || *clicked < 0 || *flags < 0) return std::nullopt;
    saved.clickedCount = static_cast<int>(*clicked);
    saved.flagCount = static_cast<int>(*flags);
    if (counters[3] != "-") {
        auto started = toInteger(counters[3]);
        if (!started) return std::nullopt;
        saved.startedAtMs = static_cast<std::int64_t>(*started);
    }

    // One ROW line per board row
    saved.cells.reserve(static_cast<std::size_t>(saved.rows * saved.cols));
    for (int r = 0; r < saved.rows; ++r) {
        if (!std::getline(is, line)) return std::nullopt;
        auto fields = splitFields(line);
        if (static_cast<int>(fields.size()) != saved.cols + 1 || fields[0] != "ROW") {
            return std::nullopt;
        }
        for (int c = 1; c <= saved.cols; ++c) {
            auto code = toInteger(fields[c]);
            if (!code || *code < 0 || *code > 15) return std::nullopt;
            saved.cells.push_back(decodeCell(static_cast<int>(*code)));
        }
    }

    return saved;
}

} // namespace sweeper::persistence
