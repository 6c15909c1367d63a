#pragma once

#include "mining/filter_types.hpp"
#include "mining/labeled_dataset.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>

#include <algorithm>
#include <cmath>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace trail_parquet {

inline void write_table(const std::string& path, const std::shared_ptr<arrow::Table>& table) {
    auto outfile_result = arrow::io::FileOutputStream::Open(path);
    if (!outfile_result.ok()) {
        throw std::runtime_error("Cannot open Parquet output file: " + path);
    }
    auto outfile = *outfile_result;

    auto props = parquet::WriterProperties::Builder()
        .compression(parquet::Compression::ZSTD)
        ->build();

    auto status = parquet::arrow::WriteTable(
        *table, arrow::default_memory_pool(), outfile,
        /*chunk_size=*/std::max<int64_t>(table->num_rows(), 1), props);
    if (!status.ok()) {
        throw std::runtime_error("Failed to write Parquet: " + status.ToString());
    }
    auto closed = outfile->Close();
    if (!closed.ok()) {
        throw std::runtime_error("Failed to close Parquet file: " + closed.ToString());
    }
}

inline std::shared_ptr<arrow::Array> finish(arrow::ArrayBuilder& b) {
    std::shared_ptr<arrow::Array> arr;
    auto st = b.Finish(&arr);
    if (!st.ok()) throw std::runtime_error("Arrow builder failed: " + st.ToString());
    return arr;
}

// ---------------------------------------------------------------------------
// write_dataset — one row per (candidate, offset), one DOUBLE column per
// trail feature (null where the value was null or never recorded).
// Returns the number of rows written.
// ---------------------------------------------------------------------------
inline int64_t write_dataset(const std::string& path, const LabeledDataset& ds) {
    std::set<std::string> feature_names;
    for (const auto& [offset, slice] : ds.offsets) {
        for (const auto& [name, values] : slice.columns) {
            (void)values;
            feature_names.insert(name);
        }
    }

    arrow::FieldVector fields;
    fields.push_back(arrow::field("candidate_id", arrow::int64()));
    fields.push_back(arrow::field("minute_offset", arrow::int64()));
    fields.push_back(arrow::field("realized_gain_pct", arrow::float64()));
    fields.push_back(arrow::field("label", arrow::utf8()));
    for (const auto& name : feature_names) {
        fields.push_back(arrow::field(name, arrow::float64()));
    }
    auto schema = arrow::schema(fields);

    arrow::Int64Builder ids, offsets;
    arrow::DoubleBuilder gains;
    arrow::StringBuilder labels;
    std::vector<std::unique_ptr<arrow::DoubleBuilder>> features;
    for (size_t f = 0; f < feature_names.size(); ++f) {
        features.push_back(std::make_unique<arrow::DoubleBuilder>());
    }

    int64_t rows = 0;
    for (const auto& [offset, slice] : ds.offsets) {
        for (size_t r = 0; r < slice.size(); ++r) {
            (void)ids.Append(slice.candidate_ids[r]);
            (void)offsets.Append(offset);
            (void)gains.Append(slice.gains[r]);
            (void)labels.Append(ds.is_good(slice.gains[r]) ? "good" : "bad");
            size_t f = 0;
            for (const auto& name : feature_names) {
                auto col = slice.columns.find(name);
                if (col == slice.columns.end() || std::isnan(col->second[r])) {
                    (void)features[f]->AppendNull();
                } else {
                    (void)features[f]->Append(col->second[r]);
                }
                ++f;
            }
            ++rows;
        }
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    arrays.push_back(finish(ids));
    arrays.push_back(finish(offsets));
    arrays.push_back(finish(gains));
    arrays.push_back(finish(labels));
    for (auto& b : features) arrays.push_back(finish(*b));

    write_table(path, arrow::Table::Make(schema, arrays));
    return rows;
}

// ---------------------------------------------------------------------------
// write_suggestions — the ranked suggestions of one mining run
// ---------------------------------------------------------------------------
inline int64_t write_suggestions(const std::string& path,
                                 const std::vector<FilterSuggestion>& suggestions) {
    auto schema = arrow::schema({
        arrow::field("run_id", arrow::int64()),
        arrow::field("column_name", arrow::utf8()),
        arrow::field("section", arrow::utf8()),
        arrow::field("minute_offset", arrow::int64()),
        arrow::field("from_value", arrow::float64()),
        arrow::field("to_value", arrow::float64()),
        arrow::field("good_kept_pct", arrow::float64()),
        arrow::field("bad_removed_pct", arrow::float64()),
        arrow::field("score", arrow::float64()),
        arrow::field("good_before", arrow::int64()),
        arrow::field("bad_before", arrow::int64()),
        arrow::field("good_after", arrow::int64()),
        arrow::field("bad_after", arrow::int64()),
    });

    arrow::Int64Builder run_id, offset, good_before, bad_before, good_after, bad_after;
    arrow::StringBuilder column, section;
    arrow::DoubleBuilder from, to, kept, removed, score;
    for (const auto& s : suggestions) {
        (void)run_id.Append(s.run_id);
        (void)column.Append(s.column_name);
        (void)section.Append(s.section);
        (void)offset.Append(s.minute_offset);
        (void)from.Append(s.from_value);
        (void)to.Append(s.to_value);
        (void)kept.Append(s.good_kept_pct);
        (void)removed.Append(s.bad_removed_pct);
        (void)score.Append(s.score);
        (void)good_before.Append(s.counts.good_before);
        (void)bad_before.Append(s.counts.bad_before);
        (void)good_after.Append(s.counts.good_after);
        (void)bad_after.Append(s.counts.bad_after);
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays = {
        finish(run_id), finish(column),  finish(section),     finish(offset),
        finish(from),   finish(to),      finish(kept),        finish(removed),
        finish(score),  finish(good_before), finish(bad_before), finish(good_after),
        finish(bad_after),
    };
    write_table(path, arrow::Table::Make(schema, arrays));
    return static_cast<int64_t>(suggestions.size());
}

}  // namespace trail_parquet
