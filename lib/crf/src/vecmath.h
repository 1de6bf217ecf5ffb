/*
 *      Dense vector helpers.
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

#ifndef    __VECMATH_H__
#define    __VECMATH_H__

#include <math.h>

#include <crftree.h>

/*
 * Dense vector helpers. The first argument is an iterator or a pointer
 * to the first element; n is the number of elements.
 */

template <class It>
inline floatval_t vecsum(It x, const int n)
{
    floatval_t s = 0.;
    for (int i = 0;i < n;++i) s += x[i];
    return s;
}

template <class It>
inline void vecscale(It y, const floatval_t a, const int n)
{
    for (int i = 0;i < n;++i) y[i] *= a;
}

template <class It>
inline floatval_t vecsumsq(It x, const int n)
{
    floatval_t s = 0.;
    for (int i = 0;i < n;++i) s += x[i] * x[i];
    return s;
}

template <class It1, class It2>
inline floatval_t vecmaxdiff(It1 x, It2 y, const int n)
{
    floatval_t d = 0.;
    for (int i = 0;i < n;++i) {
        floatval_t e = fabs(x[i] - y[i]);
        if (d < e) d = e;
    }
    return d;
}

#endif/*__VECMATH_H__*/
