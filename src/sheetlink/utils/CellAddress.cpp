#include "sheetlink/utils/CellAddress.hpp"
#include "sheetlink/core/Constants.hpp"
#include <cctype>

namespace sheetlink {
namespace utils {

using core::Constants;
using core::ErrorCode;

std::string CellAddress::columnToLetters(int column) {
    if (column < 1 || column > Constants::kMaxColumns) {
        throw core::ParameterException(fmt::format("Column {} is out of range 1-{}", column, Constants::kMaxColumns),
                                       "column");
    }

    std::string result;
    int n = column;
    while (n > 0) {
        int rem = (n - 1) % 26;
        result.insert(result.begin(), static_cast<char>('A' + rem));
        n = (n - 1) / 26;
    }
    return result;
}

core::Result<int> CellAddress::lettersToColumn(std::string_view letters) {
    if (letters.empty() || letters.size() > 3) {
        return core::makeError(ErrorCode::InvalidCellReference, "Invalid column letters", std::string(letters));
    }

    int column = 0;
    for (char ch : letters) {
        unsigned char c = static_cast<unsigned char>(std::toupper(static_cast<unsigned char>(ch)));
        if (c < 'A' || c > 'Z') {
            return core::makeError(ErrorCode::InvalidCellReference, "Invalid column letter", std::string(letters));
        }
        column = column * 26 + (c - 'A' + 1);
    }

    if (column > Constants::kMaxColumns) {
        return core::makeError(ErrorCode::InvalidCellReference, "Column out of range", std::string(letters));
    }
    return column;
}

std::string CellAddress::format(int row, int column) {
    return columnToLetters(column) + std::to_string(row);
}

std::string CellAddress::formatRange(int first_row, int first_column, int last_row, int last_column) {
    return format(first_row, first_column) + ":" + format(last_row, last_column);
}

core::Result<CellPosition> CellAddress::parse(std::string_view reference) {
    if (reference.empty()) {
        return core::makeError(ErrorCode::InvalidCellReference, "Empty cell reference");
    }

    size_t i = 0;
    if (reference[i] == '$') {
        ++i;
    }

    // 列部分
    size_t letters_begin = i;
    while (i < reference.size() && std::isalpha(static_cast<unsigned char>(reference[i]))) {
        ++i;
    }
    auto column = lettersToColumn(reference.substr(letters_begin, i - letters_begin));
    if (!column) {
        return core::makeError(ErrorCode::InvalidCellReference, "No column part in reference", std::string(reference));
    }

    if (i < reference.size() && reference[i] == '$') {
        ++i;
    }

    // 行部分
    if (i >= reference.size()) {
        return core::makeError(ErrorCode::InvalidCellReference, "No row part in reference", std::string(reference));
    }
    long row = 0;
    for (; i < reference.size(); ++i) {
        char c = reference[i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return core::makeError(ErrorCode::InvalidCellReference,
                                   "Invalid characters at end of reference", std::string(reference));
        }
        row = row * 10 + (c - '0');
        if (row > Constants::kMaxRows) {
            return core::makeError(ErrorCode::InvalidCellReference, "Row out of range", std::string(reference));
        }
    }
    if (row == 0) {
        return core::makeError(ErrorCode::InvalidCellReference, "Invalid row number in reference", std::string(reference));
    }

    return CellPosition{static_cast<int>(row), column.value()};
}

}} // namespace sheetlink::utils
