#include "normxcorr/io/fits_io.hpp"
#include "normxcorr/core/errors.hpp"
#include "normxcorr/core/utils.hpp"

#include <fitsio.h>
#include <stdexcept>
#include <vector>

namespace normxcorr::io {

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    bool_values[key] = value;
}

float full_scale_for_image_type(int image_type) {
    switch (image_type) {
        case BYTE_IMG: return 255.0f;
        case SBYTE_IMG: return 127.0f;
        case SHORT_IMG: return 32767.0f;
        case USHORT_IMG: return 65535.0f;
        case LONG_IMG: return 2147483647.0f;
        case ULONG_IMG: return 4294967295.0f;
        case FLOAT_IMG:
        case DOUBLE_IMG: return 1.0f;
        default:
            throw FitsError("unsupported FITS image type " + std::to_string(image_type));
    }
}

bool is_fits_image_path(const fs::path& path) {
    std::string name = core::to_lower(path.filename().string());
    if (core::ends_with(name, ".fz")) {
        name = name.substr(0, name.size() - 3);
    }
    return core::ends_with(name, ".fit") || core::ends_with(name, ".fits") ||
           core::ends_with(name, ".fts");
}

static void read_header_cards(fitsfile* fptr, FitsHeader& header) {
    int status = 0;
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);
    if (status) {
        return;
    }

    char card[FLEN_CARD];
    for (int i = 1; i <= nkeys; ++i) {
        status = 0;
        fits_read_record(fptr, i, card, &status);
        if (status) continue;

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) continue;

        std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || key == "END") {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) continue;

        char dtype = 'C';
        fits_get_keytype(value, &dtype, &status);
        if (status) continue;

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        try {
            switch (dtype) {
                case 'L':
                    header.set(key, val_str == "T" || val_str == "1");
                    break;
                case 'I':
                    header.set(key, std::stoi(val_str));
                    break;
                case 'F':
                    header.set(key, std::stod(val_str));
                    break;
                default:
                    header.set(key, val_str);
                    break;
            }
        } catch (const std::logic_error&) {
            // out-of-range or malformed numeric card
            header.set(key, val_str);
        }
    }
}

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    if (naxis < 2) {
        fits_close_file(fptr, &status);
        throw FitsError("FITS file has less than 2 dimensions: " + path.string());
    }

    long width = naxes[0];
    long height = naxes[1];
    long npixels = width * height;

    std::vector<float> buffer(static_cast<size_t>(npixels));
    long fpixel[3] = {1, 1, 1};

    fits_read_pix(fptr, TFLOAT, fpixel, npixels, nullptr, buffer.data(), nullptr, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS pixel data: " + path.string());
    }

    int image_type = 0;
    fits_get_img_equivtype(fptr, &image_type, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS image type: " + path.string());
    }

    FitsHeader header;
    header.image_type = image_type;
    read_header_cards(fptr, header);

    status = 0;
    fits_close_file(fptr, &status);

    Matrix2Df data = Eigen::Map<const Matrix2Df>(buffer.data(), height, width);
    return {data, header};
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    write_fits_image(path, data, header, FLOAT_IMG);
}

void write_fits_image(const fs::path& path, const Matrix2Df& data, const FitsHeader& header,
                      int image_type) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};

    fits_create_img(fptr, image_type, 2, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    for (const auto& [key, value] : header.string_values) {
        if (key.size() <= 8) {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() <= 8) {
            double val = value;
            fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() <= 8) {
            int val = value;
            fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() <= 8) {
            int val = value ? 1 : 0;
            fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
        }
    }

    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    // Row-major Eigen storage matches FITS pixel order.
    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, static_cast<LONGLONG>(data.size()),
                   const_cast<float*>(data.data()), &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS pixel data: " + path.string());
    }

    fits_close_file(fptr, &status);
    if (status) {
        throw FitsError("Cannot finalize FITS file: " + path.string());
    }
}

} // namespace normxcorr::io
