/**
 * @file labeled_table.hpp
 * @brief Raw tabular price history keyed by (field, ticker) column labels.
 *
 * A LabeledTable is the hand-off format between whatever reads the input
 * (CSV files, tests building tables in memory) and the PriceLoader. Cells are
 * kept as text so that the loader owns all parsing and error reporting.
 */

#ifndef FRONTIER_DATA_LABELED_TABLE_HPP
#define FRONTIER_DATA_LABELED_TABLE_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace frontier
{

    /**
     * @struct ColumnLabel
     * @brief Two-level column label, e.g. ("Close", "AAPL").
     */
    struct ColumnLabel
    {
        std::string field;  ///< Price field (Close, High, Volume, ...)
        std::string ticker; ///< Asset ticker symbol

        bool operator==(const ColumnLabel &other) const
        {
            return field == other.field && ticker == other.ticker;
        }
    };

    /**
     * @class LabeledTable
     * @brief Date column plus any number of labeled text columns.
     *
     * Row order is whatever the source provided; the loader is responsible
     * for ordering by date.
     */
    class LabeledTable
    {
    public:
        LabeledTable() = default;

        /**
         * @brief Construct with the date column.
         * @param dates Raw date text, one per row
         */
        explicit LabeledTable(std::vector<std::string> dates)
            : dates_(std::move(dates)) {}

        /**
         * @brief Append a labeled column.
         * @param label Column label
         * @param cells Raw cell text, one per row
         * @throws std::invalid_argument if cells.size() differs from the row count
         */
        void add_column(const ColumnLabel &label, std::vector<std::string> cells)
        {
            if (cells.size() != dates_.size())
            {
                throw std::invalid_argument(
                    "Column (" + label.field + ", " + label.ticker + ") has " +
                    std::to_string(cells.size()) + " cells, expected " +
                    std::to_string(dates_.size()));
            }
            labels_.push_back(label);
            columns_.push_back(std::move(cells));
        }

        const std::vector<std::string> &get_dates() const { return dates_; }
        const std::vector<ColumnLabel> &get_labels() const { return labels_; }

        const std::vector<std::string> &get_column(size_t index) const
        {
            return columns_.at(index);
        }

        size_t num_rows() const { return dates_.size(); }
        size_t num_columns() const { return labels_.size(); }

        /**
         * @brief Distinct field names in first-appearance order.
         */
        std::vector<std::string> fields() const
        {
            std::vector<std::string> out;
            for (const auto &label : labels_)
            {
                bool seen = false;
                for (const auto &f : out)
                {
                    if (f == label.field)
                    {
                        seen = true;
                        break;
                    }
                }
                if (!seen)
                    out.push_back(label.field);
            }
            return out;
        }

    private:
        std::vector<std::string> dates_;
        std::vector<ColumnLabel> labels_;
        std::vector<std::vector<std::string>> columns_;
    };

} // namespace frontier

#endif // FRONTIER_DATA_LABELED_TABLE_HPP
