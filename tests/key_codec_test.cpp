#include <gtest/gtest.h>
#include "core/key_codec.hpp"
#include "core/media_errors.hpp"

TEST(KeyCodecTest, EmptyValueIsUnspecified)
{
    KeyCodec codec({100, 200});
    EXPECT_FALSE(codec.parseSize("").has_value());

    DerivativeSize size = codec.parseDimensions("", "");
    EXPECT_FALSE(KeyCodec::requiresDerivative(size));
}

TEST(KeyCodecTest, AcceptsSizesOnAllowList)
{
    KeyCodec codec({100, 200});
    EXPECT_EQ(codec.parseSize("100"), 100);
    EXPECT_EQ(codec.parseSize("200"), 200);
}

TEST(KeyCodecTest, RejectsSizeOffAllowListAndEnumeratesAllowed)
{
    KeyCodec codec({100, 200, 400});
    try
    {
        codec.parseSize("150");
        FAIL() << "Expected InvalidSizeError";
    }
    catch (const InvalidSizeError &e)
    {
        EXPECT_EQ(std::string(e.what()), "size value must be one of [100, 200, 400]");
        EXPECT_EQ(e.code(), "INVALID_SIZE");
        EXPECT_EQ(e.httpStatus(), 400);
    }
}

TEST(KeyCodecTest, RejectsNonNumericAndNonPositive)
{
    KeyCodec codec(std::vector<int>{});
    EXPECT_THROW(codec.parseSize("abc"), InvalidSizeError);
    EXPECT_THROW(codec.parseSize("-5"), InvalidSizeError);
    EXPECT_THROW(codec.parseSize("0"), InvalidSizeError);
    EXPECT_THROW(codec.parseSize("12.5"), InvalidSizeError);
    EXPECT_THROW(codec.parseSize("99999999999999"), InvalidSizeError);
}

TEST(KeyCodecTest, EmptyAllowListAcceptsAnyPositiveSize)
{
    KeyCodec codec(std::vector<int>{});
    EXPECT_EQ(codec.parseSize("37"), 37);
    EXPECT_EQ(codec.parseSize("1024"), 1024);
}

TEST(KeyCodecTest, DeriveEncodesBothSides)
{
    DerivativeSize size;
    size.width = 200;
    size.height = 100;
    EXPECT_EQ(KeyCodec::derive("abc123.png", size), "abc123_200x100.png");
}

TEST(KeyCodecTest, DeriveLeavesMissingSideEmpty)
{
    DerivativeSize width_only;
    width_only.width = 200;
    EXPECT_EQ(KeyCodec::derive("abc123.jpg", width_only), "abc123_200x.jpg");

    DerivativeSize height_only;
    height_only.height = 50;
    EXPECT_EQ(KeyCodec::derive("abc123.jpg", height_only), "abc123_x50.jpg");
}

TEST(KeyCodecTest, DeriveIsReproducibleAndKeepsSubdirectory)
{
    KeyCodec codec(std::vector<int>{});
    DerivativeSize a = codec.parseDimensions("64", "32");
    DerivativeSize b = codec.parseDimensions("64", "32");
    EXPECT_EQ(KeyCodec::derive("album/pic.webp", a), KeyCodec::derive("album/pic.webp", b));
    EXPECT_EQ(KeyCodec::derive("album/pic.webp", a), "album/pic_64x32.webp");
}

TEST(KeyCodecTest, DistinctSizesNeverCollide)
{
    DerivativeSize a;
    a.width = 12;
    DerivativeSize b;
    b.width = 1;
    b.height = 2;
    EXPECT_NE(KeyCodec::derive("x.png", a), KeyCodec::derive("x.png", b));
}

TEST(KeyCodecTest, DeriveWithoutSizeIsAProgrammingError)
{
    EXPECT_THROW(KeyCodec::derive("x.png", DerivativeSize{}), std::invalid_argument);
}
