#include <cmath>
#include <vector>
#include <gtest/gtest.h>
#include "mechc/v3d.hpp"
#include "mechc/exceptions.hpp"

using namespace mechc;

TEST(V3dTest, CrossProductOfBasisVectors)
{
    MECHC_V3dT z = MECHC_V3dT::ex().cross(MECHC_V3dT::ey());
    EXPECT_TRUE(z.exact(MECHC_V3dT::ez()));

    MECHC_V3dT minus_z = MECHC_V3dT::ey().cross(MECHC_V3dT::ex());
    EXPECT_TRUE(minus_z.exact(-MECHC_V3dT::ez()));
}

TEST(V3dTest, Distances)
{
    MECHC_V3dT a(1.0, 2.0, 3.0);
    MECHC_V3dT b(4.0, 6.0, 3.0);

    EXPECT_DOUBLE_EQ(a.dist(b), 5.0);
    EXPECT_DOUBLE_EQ(a.dist1(b), 7.0);
    EXPECT_DOUBLE_EQ(a.dist2(b), 25.0);
}

TEST(V3dTest, EpsilonEquality)
{
    MECHC_V3dT a(1.0, 1.0, 1.0);
    MECHC_V3dT b(1.0 + 1e-13, 1.0, 1.0 - 1e-13);

    EXPECT_FALSE(a.exact(b));
    EXPECT_TRUE(a.equal1(b, 1e-12));
    EXPECT_TRUE(a.equal2(b, 1e-12));
    EXPECT_FALSE(a.equal1(MECHC_V3dT(1.1, 1.0, 1.0), 1e-3));
    EXPECT_TRUE(MECHC_V3dT(1e-13, 0.0, 0.0).zero2(1e-12));
}

TEST(V3dTest, LerpEndpointsAndMidpoint)
{
    MECHC_V3dT a(0.0, 0.0, 0.0);
    MECHC_V3dT b(2.0, -4.0, 6.0);

    EXPECT_TRUE(a.lerp(b, 0.0).exact(a));
    EXPECT_TRUE(a.lerp(b, 1.0).exact(b));
    EXPECT_TRUE(a.lerp(b, 0.5).exact(MECHC_V3dT(1.0, -2.0, 3.0)));
}

TEST(V3dTest, HermiteWithChordTangentsIsLinear)
{
    MECHC_V3dT a(1.0, 0.0, -1.0);
    MECHC_V3dT b(3.0, 2.0, 5.0);
    MECHC_V3dT chord = b - a;

    for (double s : {0.0, 0.25, 0.5, 0.75, 1.0})
    {
        MECHC_V3dT h = a.herp(b, chord, chord, s);
        EXPECT_TRUE(h.equal2(a.lerp(b, s), 1e-12)) << "s=" << s;
    }
}

TEST(V3dTest, HermiteHonorsEndpoints)
{
    MECHC_V3dT a(1.0, 2.0, 3.0);
    MECHC_V3dT b(-1.0, 0.0, 4.0);
    MECHC_V3dT ta(5.0, 0.0, 0.0);
    MECHC_V3dT tb(0.0, -5.0, 1.0);

    EXPECT_TRUE(a.herp(b, ta, tb, 0.0).equal2(a, 1e-15));
    EXPECT_TRUE(a.herp(b, ta, tb, 1.0).equal2(b, 1e-15));
}

TEST(V3dTest, DivisionByZeroPropagates)
{
    MECHC_V3dT v = MECHC_V3dT(1.0, 0.0, -1.0) / 0.0;
    EXPECT_TRUE(std::isinf(v.x));
    EXPECT_TRUE(std::isnan(v.y));
    EXPECT_TRUE(std::isinf(v.z));
}

TEST(V3dTest, FlatArrayConversion)
{
    std::vector<double> flat;
    MECHC_V3dT(1.0, 2.0, 3.0).to_array(flat);
    MECHC_V3dT(4.0, 5.0, 6.0).to_array(flat);
    ASSERT_EQ(flat.size(), 6u);

    EXPECT_TRUE(MECHC_V3dT::from_array(flat, 3).exact(MECHC_V3dT(4.0, 5.0, 6.0)));
    EXPECT_THROW(MECHC_V3dT::from_array(flat, 4), MECHC_OutOfRangeError);
}
