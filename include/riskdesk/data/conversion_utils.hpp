// include/riskdesk/data/conversion_utils.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <vector>
#include "riskdesk/core/error.hpp"
#include "riskdesk/core/types.hpp"

namespace riskdesk {

class DataConversionUtils {
public:
    /**
     * @brief Schema of a bar table: time (timestamp[s]), symbol, open, high,
     *        low, close, volume
     */
    static std::shared_ptr<arrow::Schema> bar_schema();

    /**
     * @brief Convert Arrow Table to vector of PriceBars
     * @param table Arrow table with the bar schema, any chunking
     * @return Result containing bars in table order
     */
    static Result<std::vector<PriceBar>> arrow_table_to_bars(
        const std::shared_ptr<arrow::Table>& table);

private:
    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);

    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);
};

}  // namespace riskdesk
