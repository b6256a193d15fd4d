#include "unit_test.h"
#include <set>
#include "contactColor.h"

using namespace xmpres;

static color::Rgb fromHex(const std::string& hex)
{
    auto byte = [&hex](size_t pos) { return static_cast<uint8_t>(std::stoi(hex.substr(pos, 2), nullptr, 16)); };
    return color::Rgb(byte(1), byte(3), byte(5));
}

static bool isHexColor(const std::string& str)
{
    if (str.size() != 7 || str[0] != '#')
        return false;
    for (size_t i = 1; i < str.size(); i++)
    {
        if (!isdigit(static_cast<unsigned char>(str[i])) && (str[i] < 'a' || str[i] > 'f'))
            return false;
    }
    return true;
}

TEST(ContactColor, Deterministic)
{
    auto a = ContactColorAssigner::assign("alice@example.com");
    auto b = ContactColorAssigner::assign("alice@example.com");
    EXPECT_EQ(a.light, b.light);
    EXPECT_EQ(a.dark, b.dark);
    EXPECT_TRUE(isHexColor(a.light)) << a.light;
    EXPECT_TRUE(isHexColor(a.dark)) << a.dark;
}

TEST(ContactColor, DifferentJidsDiffer)
{
    std::set<std::string> colors;
    const int count = 50;
    for (int i = 0; i < count; i++)
        colors.insert(ContactColorAssigner::assign("user" + std::to_string(i) + "@example.com").light);
    // a few collisions are acceptable, a constant color is not
    EXPECT_GT(colors.size(), static_cast<size_t>(count * 8 / 10));
    EXPECT_NE(ContactColorAssigner::assign("alice@example.com").light,
              ContactColorAssigner::assign("bob@example.com").light);
}

TEST(ContactColor, DarkVariantIsLighter)
{
    for (int i = 0; i < 200; i++)
    {
        auto jid = "contact" + std::to_string(i) + "@example.org";
        auto colors = ContactColorAssigner::assign(jid);
        EXPECT_GT(fromHex(colors.dark).luma(), fromHex(colors.light).luma()) << jid;
    }
}

TEST(ContactColor, HueRange)
{
    for (auto str: {"", "a", "alice@example.com", "a much longer identifier/with resource"})
    {
        double hue = color::hueAngle(str);
        EXPECT_GE(hue, 0.0);
        EXPECT_LT(hue, 360.0);
    }
    // djb2 of the empty string is 5381
    EXPECT_DOUBLE_EQ(color::hueAngle(""), 5381 / 65536.0 * 360);
    // (5381 * 33) ^ 'a' == 177604, not the XEP-0392 SHA-1 hue
    EXPECT_DOUBLE_EQ(color::hueAngle("a"), (177604 % 65536) / 65536.0 * 360);
}

TEST(ContactColor, HsluvExtremes)
{
    EXPECT_EQ(color::hsluvToRgb(120, 100, 0), color::Rgb(0, 0, 0));
    EXPECT_EQ(color::hsluvToRgb(120, 100, 100), color::Rgb(255, 255, 255));
    // no saturation gives a gray
    auto gray = color::hsluvToRgb(200, 0, 50);
    EXPECT_EQ(gray.r, gray.g);
    EXPECT_EQ(gray.g, gray.b);
    EXPECT_EQ(color::Rgb(255, 0, 16).toHex(), "#ff0010");
}
