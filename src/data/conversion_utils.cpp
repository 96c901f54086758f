// src/data/conversion_utils.cpp
#include "riskdesk/data/conversion_utils.hpp"
#include "riskdesk/core/time_utils.hpp"

namespace riskdesk {

namespace {
const std::string COMPONENT = "DataConversionUtils";
}

std::shared_ptr<arrow::Schema> DataConversionUtils::bar_schema() {
    return arrow::schema(
        {arrow::field("time", arrow::timestamp(arrow::TimeUnit::SECOND)),
         arrow::field("symbol", arrow::utf8()), arrow::field("open", arrow::float64()),
         arrow::field("high", arrow::float64()), arrow::field("low", arrow::float64()),
         arrow::field("close", arrow::float64()), arrow::field("volume", arrow::float64())});
}

Result<std::vector<PriceBar>> DataConversionUtils::arrow_table_to_bars(
    const std::shared_ptr<arrow::Table>& table) {
    if (!table) {
        return make_error<std::vector<PriceBar>>(ErrorCode::INVALID_DATA, "Table pointer is null",
                                                 COMPONENT);
    }

    std::vector<std::string> required_columns = {"time", "symbol", "open", "high",
                                                 "low",  "close",  "volume"};
    for (const auto& col : required_columns) {
        if (table->GetColumnByName(col) == nullptr) {
            return make_error<std::vector<PriceBar>>(ErrorCode::INVALID_DATA,
                                                     "Missing required column: " + col, COMPONENT);
        }
    }

    std::vector<PriceBar> bars;
    if (table->num_rows() == 0) {
        return Result<std::vector<PriceBar>>(std::move(bars));
    }

    try {
        // One chunk per column so rows can be addressed by index
        auto combined = table->CombineChunks();
        if (!combined.ok()) {
            return make_error<std::vector<PriceBar>>(
                ErrorCode::CONVERSION_ERROR,
                "Failed to combine table chunks: " + combined.status().ToString(), COMPONENT);
        }
        std::shared_ptr<arrow::Table> flat = *combined;

        auto time_array = flat->GetColumnByName("time")->chunk(0);
        auto symbol_array = flat->GetColumnByName("symbol")->chunk(0);
        auto open_array = flat->GetColumnByName("open")->chunk(0);
        auto high_array = flat->GetColumnByName("high")->chunk(0);
        auto low_array = flat->GetColumnByName("low")->chunk(0);
        auto close_array = flat->GetColumnByName("close")->chunk(0);
        auto volume_array = flat->GetColumnByName("volume")->chunk(0);

        bars.reserve(flat->num_rows());

        for (int64_t i = 0; i < flat->num_rows(); ++i) {
            auto ts_result = extract_timestamp(time_array, i);
            if (ts_result.is_error()) {
                return forward_error<std::vector<PriceBar>>(ts_result);
            }

            auto symbol_result = extract_string(symbol_array, i);
            if (symbol_result.is_error()) {
                return forward_error<std::vector<PriceBar>>(symbol_result);
            }

            auto open_result = extract_double(open_array, i);
            auto high_result = extract_double(high_array, i);
            auto low_result = extract_double(low_array, i);
            auto close_result = extract_double(close_array, i);
            auto volume_result = extract_double(volume_array, i);

            if (open_result.is_error() || high_result.is_error() || low_result.is_error() ||
                close_result.is_error() || volume_result.is_error()) {
                return make_error<std::vector<PriceBar>>(
                    ErrorCode::CONVERSION_ERROR,
                    "Error extracting OHLCV values at row " + std::to_string(i), COMPONENT);
            }

            bars.emplace_back(symbol_result.value(), core::floor_to_day(ts_result.value()),
                              open_result.value(), high_result.value(), low_result.value(),
                              close_result.value(), volume_result.value());
        }

        return Result<std::vector<PriceBar>>(std::move(bars));

    } catch (const std::exception& e) {
        return make_error<std::vector<PriceBar>>(
            ErrorCode::CONVERSION_ERROR,
            std::string("Error converting table to bars: ") + e.what(), COMPONENT);
    }
}

Result<Timestamp> DataConversionUtils::extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                                         int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA, "Invalid array or index", COMPONENT);
    }
    if (array->type_id() != arrow::Type::TIMESTAMP) {
        return make_error<Timestamp>(ErrorCode::CONVERSION_ERROR,
                                     "Column 'time' is not a timestamp: " +
                                         array->type()->ToString(),
                                     COMPONENT);
    }

    auto ts_array = std::static_pointer_cast<arrow::TimestampArray>(array);
    if (ts_array->IsNull(index)) {
        return make_error<Timestamp>(ErrorCode::INVALID_DATA,
                                     "Null timestamp value at index " + std::to_string(index),
                                     COMPONENT);
    }

    return Result<Timestamp>(core::from_epoch_seconds(ts_array->Value(index)));
}

Result<double> DataConversionUtils::extract_double(const std::shared_ptr<arrow::Array>& array,
                                                   int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<double>(ErrorCode::INVALID_DATA, "Invalid array or index", COMPONENT);
    }
    if (array->type_id() != arrow::Type::DOUBLE) {
        return make_error<double>(ErrorCode::CONVERSION_ERROR,
                                  "Expected double column, got " + array->type()->ToString(),
                                  COMPONENT);
    }

    auto double_array = std::static_pointer_cast<arrow::DoubleArray>(array);
    if (double_array->IsNull(index)) {
        return make_error<double>(ErrorCode::INVALID_DATA,
                                  "Null double value at index " + std::to_string(index),
                                  COMPONENT);
    }
    return Result<double>(double_array->Value(index));
}

Result<std::string> DataConversionUtils::extract_string(const std::shared_ptr<arrow::Array>& array,
                                                        int64_t index) {
    if (!array || index < 0 || index >= array->length()) {
        return make_error<std::string>(ErrorCode::INVALID_DATA, "Invalid array or index",
                                       COMPONENT);
    }
    if (array->type_id() != arrow::Type::STRING) {
        return make_error<std::string>(ErrorCode::CONVERSION_ERROR,
                                       "Expected string column, got " + array->type()->ToString(),
                                       COMPONENT);
    }

    auto string_array = std::static_pointer_cast<arrow::StringArray>(array);
    if (string_array->IsNull(index)) {
        return make_error<std::string>(ErrorCode::INVALID_DATA,
                                       "Null string value at index " + std::to_string(index),
                                       COMPONENT);
    }
    return Result<std::string>(string_array->GetString(index));
}

}  // namespace riskdesk
