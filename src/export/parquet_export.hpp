#pragma once

#include "schedule/schedule_builder.hpp"
#include "time_utils.hpp"

#include <arrow/api.h>
#include <arrow/io/file.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

// ---------------------------------------------------------------------------
// Parquet schedule export - one row per shift, canonical order, ZSTD
// ---------------------------------------------------------------------------
namespace schedule_parquet {

inline void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

inline std::shared_ptr<arrow::Schema> schema() {
    arrow::FieldVector fields;
    fields.push_back(arrow::field("date", arrow::utf8()));
    fields.push_back(arrow::field("day", arrow::utf8()));
    fields.push_back(arrow::field("start_time", arrow::utf8()));
    fields.push_back(arrow::field("end_time", arrow::utf8()));
    fields.push_back(arrow::field("hours", arrow::float64()));
    fields.push_back(arrow::field("person", arrow::utf8()));
    fields.push_back(arrow::field("layer", arrow::utf8()));
    fields.push_back(arrow::field("color", arrow::utf8()));
    fields.push_back(arrow::field("layer_index", arrow::int64()));
    return arrow::schema(fields);
}

inline std::shared_ptr<arrow::Array> string_column(const std::vector<std::string>& values,
                                                   const std::string& name) {
    arrow::StringBuilder b;
    check(b.AppendValues(values), "Append " + name);
    std::shared_ptr<arrow::Array> arr;
    check(b.Finish(&arr), "Finish " + name);
    return arr;
}

inline std::shared_ptr<arrow::Table> to_table(const BuiltSchedule& built) {
    const auto& shifts = built.schedule.shifts;
    std::vector<std::string> dates, days, starts, ends, people, layers, colors;
    std::vector<double> hours;
    std::vector<int64_t> layer_indices;

    for (const auto& s : shifts) {
        dates.push_back(time_utils::format_date(s.date));
        days.push_back(time_utils::weekday_name(s.date));
        starts.push_back(s.start_time);
        ends.push_back(s.end_time);
        hours.push_back(s.hours());
        people.push_back(s.person);
        layers.push_back(s.layer_name);
        colors.push_back(built.colors.color_for(s.person));
        layer_indices.push_back(s.layer_index);
    }

    std::vector<std::shared_ptr<arrow::Array>> arrays;
    arrays.push_back(string_column(dates, "date"));
    arrays.push_back(string_column(days, "day"));
    arrays.push_back(string_column(starts, "start_time"));
    arrays.push_back(string_column(ends, "end_time"));
    {
        arrow::DoubleBuilder b;
        check(b.AppendValues(hours), "Append hours");
        std::shared_ptr<arrow::Array> arr;
        check(b.Finish(&arr), "Finish hours");
        arrays.push_back(arr);
    }
    arrays.push_back(string_column(people, "person"));
    arrays.push_back(string_column(layers, "layer"));
    arrays.push_back(string_column(colors, "color"));
    {
        arrow::Int64Builder b;
        check(b.AppendValues(layer_indices), "Append layer_index");
        std::shared_ptr<arrow::Array> arr;
        check(b.Finish(&arr), "Finish layer_index");
        arrays.push_back(arr);
    }

    return arrow::Table::Make(schema(), arrays);
}

// Written to a temporary sibling, renamed into place on success.
inline void write(const BuiltSchedule& built, const std::string& path) {
    auto table = to_table(built);
    const std::string tmp_path = path + ".tmp";

    try {
        auto outfile_result = arrow::io::FileOutputStream::Open(tmp_path);
        if (!outfile_result.ok()) {
            throw std::runtime_error("Cannot open Parquet output file: " + path);
        }
        auto outfile = *outfile_result;

        auto props = parquet::WriterProperties::Builder()
            .compression(parquet::Compression::ZSTD)
            ->build();

        int64_t chunk = std::max<int64_t>(1, table->num_rows());
        check(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(), outfile,
                                         chunk, props),
              "Failed to write Parquet");
        check(outfile->Close(), "Failed to close Parquet output");
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        throw;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::filesystem::remove(tmp_path, ec);
        throw std::runtime_error("Cannot replace output file: " + path);
    }
}

}  // namespace schedule_parquet
