#include "contactColor.h"
#include <math.h>
#include <stdio.h>
#include <algorithm>
#include <limits>

namespace xmpres
{
namespace color
{
// D65 reference white in u'v'
static const double kRefU = 0.19783000664283681;
static const double kRefV = 0.468319994938791;
// CIE L*u*v* constants
static const double kKappa = 903.2962962962963;
static const double kEpsilon = 0.008856451679035631;
static const double kPi = 3.14159265358979323846;
// XYZ -> linear sRGB
static const double kMInv[3][3] = {
    { 3.240969941904521, -1.537383177570093, -0.498610760293 },
    {-0.96924363628087,   1.8759675015077202, 0.041555057407175 },
    { 0.055630079696993, -0.20397695888897,   1.0569715142428786 }
};

struct Line
{
    double slope;
    double intercept;
};

// The six lines bounding the sRGB gamut at lightness l, in the (u,v) plane
static void gamutBounds(double l, Line (&bounds)[6])
{
    double sub1 = pow(l + 16, 3) / 1560896;
    double sub2 = (sub1 > kEpsilon) ? sub1 : l / kKappa;
    int idx = 0;
    for (int c = 0; c < 3; c++)
    {
        double m1 = kMInv[c][0];
        double m2 = kMInv[c][1];
        double m3 = kMInv[c][2];
        for (int t = 0; t < 2; t++)
        {
            double top1 = (284517 * m1 - 94839 * m3) * sub2;
            double top2 = (838422 * m3 + 769860 * m2 + 731718 * m1) * l * sub2 - 769860 * t * l;
            double bottom = (632260 * m3 - 126452 * m2) * sub2 + 126452 * t;
            bounds[idx++] = { top1 / bottom, top2 / bottom };
        }
    }
}

static double maxChromaForLH(double l, double h)
{
    double hrad = h / 360 * kPi * 2;
    Line bounds[6];
    gamutBounds(l, bounds);
    double result = std::numeric_limits<double>::infinity();
    for (auto& line: bounds)
    {
        double length = line.intercept / (sin(hrad) - line.slope * cos(hrad));
        if (length >= 0)
            result = std::min(result, length);
    }
    return result;
}

static inline double toSrgb(double c)
{
    return (c <= 0.0031308) ? 12.92 * c : 1.055 * pow(c, 1 / 2.4) - 0.055;
}

static inline uint8_t toByte(double c)
{
    return static_cast<uint8_t>(lround(std::max(0.0, std::min(1.0, toSrgb(c))) * 255));
}

Rgb hsluvToRgb(double h, double s, double l)
{
    // HSLuv -> LCh
    double chroma;
    if (l > 99.9999999)
    {
        l = 100;
        chroma = 0;
    }
    else if (l < 0.00000001)
    {
        l = 0;
        chroma = 0;
    }
    else
    {
        chroma = maxChromaForLH(l, h) / 100 * s;
    }
    // LCh -> Luv
    double hrad = h / 360 * kPi * 2;
    double u = cos(hrad) * chroma;
    double v = sin(hrad) * chroma;
    if (l == 0)
        return Rgb(0, 0, 0);

    // Luv -> XYZ
    double varU = u / (13 * l) + kRefU;
    double varV = v / (13 * l) + kRefV;
    double y = (l > kKappa * kEpsilon) ? pow((l + 16) / 116, 3) : l / kKappa;
    double x = y * 9 * varU / (4 * varV);
    double z = y * (12 - 3 * varU - 20 * varV) / (4 * varV);

    // XYZ -> sRGB
    double lin[3];
    for (int i = 0; i < 3; i++)
        lin[i] = kMInv[i][0] * x + kMInv[i][1] * y + kMInv[i][2] * z;
    return Rgb(toByte(lin[0]), toByte(lin[1]), toByte(lin[2]));
}

double hueAngle(const std::string& input)
{
    uint32_t hash = 5381;
    for (unsigned char ch: input)
        hash = ((hash << 5) + hash) ^ ch;
    return (hash % 65536) / 65536.0 * 360;
}

Rgb consistentColor(const std::string& input, double saturation, double lightness)
{
    return hsluvToRgb(hueAngle(input), saturation, lightness);
}

std::string Rgb::toHex() const
{
    char buf[8];
    snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    return buf;
}
}

ContactColors ContactColorAssigner::assign(const std::string& jid)
{
    double hue = color::hueAngle(jid);
    ContactColors result;
    result.light = color::hsluvToRgb(hue, kSaturation, kLightnessLight).toHex();
    result.dark = color::hsluvToRgb(hue, kSaturation, kLightnessDark).toHex();
    return result;
}
}
