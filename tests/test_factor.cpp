/*
 *      Tests of the factor primitives.
 *
 * Copyright (c) 2007-2010, Naoaki Okazaki
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *     * Redistributions of source code must retain the above copyright
 *       notice, this list of conditions and the following disclaimer.
 *     * Redistributions in binary form must reproduce the above copyright
 *       notice, this list of conditions and the following disclaimer in the
 *       documentation and/or other materials provided with the distribution.
 *     * Neither the names of the authors nor the names of its contributors
 *       may be used to endorse or promote products derived from this
 *       software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/* $Id$ */

#include <gtest/gtest.h>

#include <crftree.h>

TEST(FactorIndexing, FirstVariableVariesFastest)
{
    std::vector<int> card = {2, 3};
    std::vector<int> a;

    EXPECT_EQ(0, crftree_assignment_to_index({0, 0}, card));
    EXPECT_EQ(1, crftree_assignment_to_index({1, 0}, card));
    EXPECT_EQ(2, crftree_assignment_to_index({0, 1}, card));
    EXPECT_EQ(5, crftree_assignment_to_index({1, 2}, card));

    crftree_index_to_assignment(5, card, a);
    EXPECT_EQ(std::vector<int>({1, 2}), a);
    crftree_index_to_assignment(4, card, a);
    EXPECT_EQ(std::vector<int>({0, 2}), a);
}

TEST(FactorMarginalize, SumsOutVariables)
{
    crftree_factor_t f, m;
    crftree_factor_init(f, {2, 0}, {2, 2}, 0.);
    f.val = {1., 2., 3., 4.};

    crftree_factor_marginalize(f, {2}, m);
    EXPECT_EQ(std::vector<int>({0}), m.vars);
    EXPECT_EQ(std::vector<int>({2}), m.card);
    ASSERT_EQ(2u, m.num_values());
    EXPECT_DOUBLE_EQ(3., m.val[0]);
    EXPECT_DOUBLE_EQ(7., m.val[1]);

    crftree_factor_marginalize(f, {0, 2}, m);
    EXPECT_TRUE(m.vars.empty());
    ASSERT_EQ(1u, m.num_values());
    EXPECT_DOUBLE_EQ(10., m.val[0]);
}

TEST(FactorMarginalize, SortsTheRemainingScope)
{
    crftree_factor_t f, m;
    crftree_factor_init(f, {3, 1}, {2, 3}, 0.);
    for (int i = 0;i < 6;++i) f.val[i] = i;

    /* Eliminating a variable outside the scope changes nothing. */
    crftree_factor_marginalize(f, {7}, m);
    EXPECT_EQ(std::vector<int>({1, 3}), m.vars);
    EXPECT_EQ(std::vector<int>({3, 2}), m.card);
    for (int a1 = 0;a1 < 3;++a1) {
        for (int a3 = 0;a3 < 2;++a3) {
            EXPECT_DOUBLE_EQ(a3 + 2 * a1, m.val[a1 + 3 * a3]);
        }
    }
}

TEST(FactorProduct, MultipliesOverTheUnion)
{
    crftree_factor_t a, b, c;
    crftree_factor_init(a, {0}, {2}, 0.);
    a.val = {1., 2.};
    crftree_factor_init(b, {1, 0}, {3, 2}, 0.);
    for (int i = 0;i < 6;++i) b.val[i] = i + 1;

    ASSERT_EQ(CRFTREE_SUCCESS, crftree_factor_product(a, b, c));
    EXPECT_EQ(std::vector<int>({0, 1}), c.vars);
    EXPECT_EQ(std::vector<int>({2, 3}), c.card);
    for (int a0 = 0;a0 < 2;++a0) {
        for (int a1 = 0;a1 < 3;++a1) {
            EXPECT_DOUBLE_EQ(a.val[a0] * b.val[a1 + 3 * a0], c.val[a0 + 2 * a1]);
        }
    }

    /* The result may alias an operand. */
    ASSERT_EQ(CRFTREE_SUCCESS, crftree_factor_product(a, a, a));
    EXPECT_DOUBLE_EQ(1., a.val[0]);
    EXPECT_DOUBLE_EQ(4., a.val[1]);
}

TEST(FactorProduct, RejectsConflictingCardinalities)
{
    crftree_factor_t a, b, c;
    crftree_factor_init(a, {0}, {2}, 1.);
    crftree_factor_init(b, {0}, {3}, 1.);
    EXPECT_EQ(CRFTREEERR_INCOMPATIBLE, crftree_factor_product(a, b, c));
}

TEST(FactorInit, RejectsOversizedTables)
{
    crftree_factor_t f;
    ASSERT_EQ(CRFTREE_SUCCESS, crftree_factor_init(f, {4}, {3}, 2.));

    EXPECT_EQ(CRFTREEERR_OUTOFMEMORY, crftree_factor_init(f, {0, 1}, {65536, 65536}, 1.));
    EXPECT_EQ(CRFTREEERR_INCOMPATIBLE, crftree_factor_init(f, {0, 1}, {2, 0}, 1.));

    /* The factor is left as it was. */
    EXPECT_EQ(std::vector<int>({4}), f.vars);
    ASSERT_EQ(3u, f.num_values());
    EXPECT_DOUBLE_EQ(2., f.val[2]);
}

TEST(FactorProduct, RejectsOversizedProducts)
{
    crftree_factor_t a, b, c;
    ASSERT_EQ(CRFTREE_SUCCESS, crftree_factor_init(a, {0}, {65536}, 1.));
    ASSERT_EQ(CRFTREE_SUCCESS, crftree_factor_init(b, {1}, {65536}, 1.));
    EXPECT_EQ(CRFTREEERR_OUTOFMEMORY, crftree_factor_product(a, b, c));
}

TEST(FactorNormalize, ScalesToOne)
{
    crftree_factor_t f;
    crftree_factor_init(f, {0, 1}, {2, 2}, 0.);
    f.val = {1., 1., 2., 4.};

    EXPECT_DOUBLE_EQ(8., crftree_factor_sum(f));
    EXPECT_DOUBLE_EQ(8., crftree_factor_normalize(f));
    EXPECT_DOUBLE_EQ(1., crftree_factor_sum(f));
    EXPECT_DOUBLE_EQ(.5, f.val[3]);
}
