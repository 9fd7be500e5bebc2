// SPDX-License-Identifier: GPL-2.0-or-later
/***** TEST FILTERS *******/

#ifndef UMBRA_TEST_RENDERER_TESTFILTERS_H
#define UMBRA_TEST_RENDERER_TESTFILTERS_H

#include <algorithm>
#include <array>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

/**
 * Return a single unpremultiplied pixel color for testing.
 */
struct SampleColor
{
    int x, y;

    template <typename AccessSrc>
    std::vector<double> filter(AccessSrc const &src) const
    {
        auto color = src.colorAt(x, y, true);
        return {color.begin(), color.end()};
    }
};

/**
 * Add up the alpha of every pixel, a blur must not change the total much.
 */
struct AlphaTotal
{
    template <typename AccessSrc>
    double filter(AccessSrc const &src) const
    {
        double total = 0.0;
        for (auto y = 0; y < src.height(); y++) {
            for (auto x = 0; x < src.width(); x++) {
                total += src.alphaAt(x, y);
            }
        }
        return total;
    }
};

/**
 * Build a list of pixels which will be set into a surface when the
 * filter is run. Allows creating testing textures.
 *
 * All colors are NOT alpha pre-multiplied.
 */
struct SetPixels
{
    std::vector<std::tuple<int, int, std::array<double, 4>>> _pixels;

    void pixelWillBe(int x, int y, std::array<double, 4> color) { _pixels.emplace_back(x, y, color); }

    void rectWillBe(int x, int y, int w, int h, std::array<double, 4> color)
    {
        for (auto y0 = y; y0 < y + h; y0++) {
            for (auto x0 = x; x0 < x + w; x0++) {
                pixelWillBe(x0, y0, color);
            }
        }
    }

    template <typename Access>
    void filter(Access &surface) const
    {
        for (auto &[x, y, color] : _pixels) {
            typename Access::Color out;
            for (size_t c = 0; c < out.size() && c < color.size(); c++) {
                out[c] = color[c];
            }
            surface.colorTo(x, y, out, true);
        }
    }
};

struct ClearPixels
{
    template <typename Access>
    void filter(Access &surface) const
    {
        typename Access::Color blank = {};
        for (auto y = 0; y < surface.height(); y++) {
            for (auto x = 0; x < surface.width(); x++) {
                surface.colorTo(x, y, blank);
            }
        }
    }
};

/**
 * Construct a string reprentation of the image pixels.
 */
class PatchResult : public std::string
{
public:
    unsigned _stride;

    PatchResult(std::string const &in, unsigned stride)
        : std::string(in)
        , _stride(stride)
    {}

    /**
     * Format a string into a character image for test output when failing.
     */
    friend void PrintTo(const PatchResult &obj, std::ostream *oo)
    {
        for (unsigned c = 0; c < obj.size(); c++) {
            if (obj._stride == 0 || c % obj._stride == 0) {
                if (c)
                    *oo << "\"";
                *oo << "\n    \"";
            }
            *oo << obj[c];
        }
        *oo << "\"\n";
    }
};

/**
 * Shrink an image into characters, each one standing for a square patch of pixels.
 *
 * ALPHA maps the average alpha onto " ..:::-+=oO*xX$&" from transparent to opaque.
 * COLORS gives each channel two bits (over 30% and over 60% of the patch above half).
 */
struct PixelPatch
{
    enum class Method
    {
        ALPHA,
        COLORS,
    };

    Method _method = Method::ALPHA;
    unsigned _patch_x = 3;
    unsigned _patch_y = 3;
    bool _alpha_unmultiplied = true;

    template <typename Access>
    PatchResult filter(Access const &src) const
    {
        static std::vector<unsigned char> const weights = {' ', ' ', ' ', '.', '.', '.', ':', ':', '-',
                                                           '+', '=', 'o', 'O', '*', 'x', 'X', '$', '&'};

        double size = _patch_x * _patch_y;
        char r0 = (_method == Method::ALPHA) ? 0x40 : 0x30;

        int const cols = src.width() / _patch_x;
        int const rows = src.height() / _patch_y;

        std::stringstream output;
        for (int y = 0; y < rows; y++) {
            for (int x = 0; x < cols; x++) {
                // inital values
                typename Access::Color colors;
                typename Access::Color lights;
                colors.fill(0.0);
                lights.fill(0.0);

                for (unsigned cy = 0; cy < _patch_y; cy++) {
                    for (unsigned cx = 0; cx < _patch_x; cx++) {
                        int tx = x * _patch_x + cx;
                        int ty = y * _patch_y + cy;
                        if (_method == Method::ALPHA) {
                            lights.back() += src.alphaAt(tx, ty);
                        } else {
                            auto color = src.colorAt(tx, ty, _alpha_unmultiplied);
                            for (size_t c = 0; c < colors.size(); c++) {
                                colors[c] += color[c] > 0.5;
                                lights[c] += color[c];
                            }
                        }
                    }
                }
                unsigned char r = r0;
                if (_method == Method::ALPHA) {
                    r = weights[(int)(std::clamp(lights.back() / size, 0.0, 1.0) * (weights.size() - 1))];
                } else {
                    for (unsigned c = 0; c < colors.size() - 1; c++) {
                        r += (unsigned char)(((colors[c] / size > 0.3) + (colors[c] / size > 0.6)) << (c * 2));
                    }
                }
                // Map zero to space for readability
                if (r == r0) {
                    r = lights.back() / size > 0.3 ? '.' : ' ';
                }
                // Cap anything higher than ascii
                while (r > 'z') {
                    r -= ('z' - r0);
                }
                output << r;
            }
        }
        return PatchResult(output.str(), cols);
    }
};

#endif // UMBRA_TEST_RENDERER_TESTFILTERS_H

/*
  Local Variables:
  mode:c++
  c-file-style:"stroustrup"
  c-file-offsets:((innamespace . 0)(inline-open . 0)(case-label . +))
  indent-tabs-mode:nil
  fill-column:99
  End:
*/
// vim: filetype=cpp:expandtab:shiftwidth=4:tabstop=8:softtabstop=4:fileencoding=utf-8:textwidth=99 :
