#ifndef XMPRES_CONTACTCOLOR_H
#define XMPRES_CONTACTCOLOR_H

#include <stdint.h>
#include <string>

namespace xmpres
{
namespace color
{
struct Rgb
{
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    Rgb() {}
    Rgb(uint8_t aR, uint8_t aG, uint8_t aB): r(aR), g(aG), b(aB) {}
    bool operator==(const Rgb& other) const { return r == other.r && g == other.g && b == other.b; }
    /** Perceived lightness, 0.299r + 0.587g + 0.114b */
    double luma() const { return 0.299*r + 0.587*g + 0.114*b; }
    /** Lowercase "#rrggbb" */
    std::string toHex() const;
};

/** @brief Derives a hue angle in [0, 360) from a string, using the djb2 hash.
 * The same input always yields the same hue */
double hueAngle(const std::string& input);

/** @brief Converts an HSLuv color to sRGB.
 * @param h Hue angle in degrees, [0, 360)
 * @param s Saturation, [0, 100]
 * @param l Lightness, [0, 100]
 */
Rgb hsluvToRgb(double h, double s, double l);

/** Color of \c input at the given HSLuv saturation and lightness */
Rgb consistentColor(const std::string& input, double saturation, double lightness);
}

struct ContactColors
{
    std::string light; //for light themes
    std::string dark;  //for dark themes
};

/** Stable, per-identity badge colors. Assigned once, when a contact is first
 * seen, and never recomputed */
class ContactColorAssigner
{
public:
    enum { kSaturation = 100, kLightnessLight = 35, kLightnessDark = 65 };
    static ContactColors assign(const std::string& jid);
};
}
#endif
