#include "swath_sampler/io/fits_io.hpp"
#include "swath_sampler/core/errors.hpp"

#include <fitsio.h>

namespace swath_sampler::io {

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

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
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

static FitsHeader read_header_cards(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);

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

        char dtype;
        fits_get_keytype(value, &dtype, &status);
        if (status) continue;

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'C':
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::exception&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }
    return header;
}

static void write_header_cards(fitsfile* fptr, const FitsHeader& header, int& status) {
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
}

std::pair<Swath, FitsHeader> read_swath_fits(const fs::path& path) {
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

    if (naxis != 3) {
        fits_close_file(fptr, &status);
        throw FitsError("Swath cube must have 3 axes, found " + std::to_string(naxis) + ": " +
                        path.string());
    }

    const long width = naxes[0];
    const long height = naxes[1];
    const long nbands = naxes[2];

    Swath swath(static_cast<int>(nbands), static_cast<int>(height), static_cast<int>(width));
    for (long b = 0; b < nbands; ++b) {
        long fpixel[3] = {1, 1, b + 1};
        Matrix2Df& band = swath.bands[static_cast<size_t>(b)];
        fits_read_pix(fptr, TFLOAT, fpixel, width * height, nullptr, band.data(), nullptr,
                      &status);
        if (status) {
            fits_close_file(fptr, &status);
            throw FitsError("Cannot read FITS pixel data (band " + std::to_string(b) +
                            "): " + path.string());
        }
    }

    FitsHeader header = read_header_cards(fptr);
    fits_close_file(fptr, &status);

    return {std::move(swath), std::move(header)};
}

void write_swath_fits(const fs::path& path, const Swath& swath, const FitsHeader& header) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    long naxes[3] = {swath.cols(), swath.rows(), swath.band_count()};

    fits_create_img(fptr, FLOAT_IMG, 3, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    write_header_cards(fptr, header, status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write FITS header: " + path.string());
    }

    const long band_pixels = static_cast<long>(swath.rows()) * swath.cols();
    for (int b = 0; b < swath.band_count(); ++b) {
        long fpixel[3] = {1, 1, b + 1};
        fits_write_pix(fptr, TFLOAT, fpixel, band_pixels,
                       const_cast<float*>(swath.bands[static_cast<size_t>(b)].data()),
                       &status);
        if (status) {
            fits_close_file(fptr, &status);
            throw FitsError("Cannot write FITS pixel data: " + path.string());
        }
    }

    fits_close_file(fptr, &status);
}

void write_tile_stack_fits(const fs::path& path, const TileCollection& tiles,
                           const FitsHeader& header) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();

    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    if (tiles.empty()) {
        fits_create_img(fptr, FLOAT_IMG, 0, nullptr, &status);
    } else {
        const BandStack& first = tiles.tiles.front();
        long naxes[4] = {first.cols(), first.rows(), first.band_count(),
                         static_cast<long>(tiles.size())};
        fits_create_img(fptr, FLOAT_IMG, 4, naxes, &status);
    }
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot create FITS image: " + path.string());
    }

    write_header_cards(fptr, header, status);
    int ntiles = static_cast<int>(tiles.size());
    fits_update_key(fptr, TINT, "NTILES", &ntiles, "number of tiles", &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot write tile stack header: " + path.string());
    }

    long n = 0;
    for (const BandStack& tile : tiles.tiles) {
        for (int b = 0; b < tile.band_count(); ++b) {
            const Matrix2Df& band = tile.bands[static_cast<size_t>(b)];
            long fpixel[4] = {1, 1, b + 1, n + 1};
            fits_write_pix(fptr, TFLOAT, fpixel, static_cast<long>(band.size()),
                           const_cast<float*>(band.data()), &status);
        }
        if (status) {
            fits_close_file(fptr, &status);
            throw FitsError("Cannot write tile " + std::to_string(n) + ": " + path.string());
        }
        ++n;
    }

    fits_close_file(fptr, &status);
}

std::pair<std::vector<BandStack>, FitsHeader> read_tile_stack_fits(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;

    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }

    int naxis = 0;
    long naxes[4] = {0, 0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 4, &bitpix, &naxis, naxes, &status);
    if (status) {
        fits_close_file(fptr, &status);
        throw FitsError("Cannot read FITS image parameters: " + path.string());
    }

    FitsHeader header = read_header_cards(fptr);

    std::vector<BandStack> tiles;
    if (naxis == 0) {
        fits_close_file(fptr, &status);
        return {std::move(tiles), std::move(header)};
    }
    if (naxis != 4) {
        fits_close_file(fptr, &status);
        throw FitsError("Tile stack must have 4 axes, found " + std::to_string(naxis) + ": " +
                        path.string());
    }

    const long width = naxes[0];
    const long height = naxes[1];
    const long nbands = naxes[2];
    const long ntiles = naxes[3];

    tiles.reserve(static_cast<size_t>(ntiles));
    for (long t = 0; t < ntiles; ++t) {
        BandStack tile(static_cast<int>(nbands), static_cast<int>(height),
                       static_cast<int>(width));
        for (long b = 0; b < nbands; ++b) {
            long fpixel[4] = {1, 1, b + 1, t + 1};
            fits_read_pix(fptr, TFLOAT, fpixel, width * height, nullptr,
                          tile.bands[static_cast<size_t>(b)].data(), nullptr, &status);
        }
        if (status) {
            fits_close_file(fptr, &status);
            throw FitsError("Cannot read tile " + std::to_string(t) + ": " + path.string());
        }
        tiles.push_back(std::move(tile));
    }

    fits_close_file(fptr, &status);
    return {std::move(tiles), std::move(header)};
}

} // namespace swath_sampler::io
