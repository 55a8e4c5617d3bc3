#pragma once

#include "normxcorr/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace normxcorr::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    // cfitsio equivalent image type of the data read (BITPIX with BZERO
    // applied, e.g. 20 for unsigned 16-bit). Zero when not read from a file.
    int image_type = 0;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

bool is_fits_image_path(const fs::path& path);

// Largest sample of a FITS image type: 255 for 8-bit, 65535 for unsigned
// 16-bit, 1.0 for floating point. Throws FitsError for unknown types.
float full_scale_for_image_type(int image_type);

// Reads the first image plane as float samples.
std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

// image_type takes cfitsio values (8, 16, 20, 32, 40, -32, -64); samples are
// converted from float on write.
void write_fits_image(const fs::path& path, const Matrix2Df& data, const FitsHeader& header,
                      int image_type);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

} // namespace normxcorr::io
