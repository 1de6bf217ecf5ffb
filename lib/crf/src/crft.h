/*
 *      Clique-tree CRF internal declarations.
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

#ifndef    __CRFT_H__
#define    __CRFT_H__

#include <stdio.h>
#include <vector>

#include <crftree.h>
#include "crftree_internal.h"


/**
 * \defgroup crft_factor.cpp
 */
/** @{ */

/**
 * Compute the stride of each variable of #vars within a factor.
 *  The stride of a variable absent from the factor is zero.
 */
void crftx_strides(const crftree_factor_t& factor, const std::vector<int>& vars, std::vector<int>& strides);

/**
 * Test whether every variable of #scope belongs to #vars.
 */
bool crftx_covers(const std::vector<int>& vars, const std::vector<int>& scope);

/** @} */



/**
 * \defgroup crft_context.cpp
 */
/** @{ */

/**
 * Functionality flags for clique trees.
 */
enum {
    CTF_BUILT       = 0x01,     /**< Cliques and edges are available. */
    CTF_CALIBRATED  = 0x02,     /**< Beliefs and the log partition are available. */
};

/**
 * An edge of a clique tree.
 */
struct crft_edge_t {
    int                 src;    /**< Clique at one end. */
    int                 dst;    /**< Clique at the other end. */
    std::vector<int>    sep;    /**< Separator (ascending variables). */
};

/**
 * Clique tree (or forest) of a factor set.
 *  Cliques hold their potentials after crftc_build() and their calibrated
 *  beliefs after crftc_calibrate().
 */
struct crft_cliquetree_t {
    /**
     * Functionality flags (CTF_*).
     */
    int flag;

    /**
     * Cliques.
     *  Each clique is a factor whose scope is ascending.
     */
    std::vector<crftree_factor_t> cliques;

    /**
     * Edges of the forest.
     */
    std::vector<crft_edge_t> edges;

    /**
     * Incident edges.
     *  This is a [C] array whose element [c] lists the edges touching
     *  the clique #c.
     */
    std::vector<std::vector<int> > adjacency;

    /**
     * Root clique of each connected component.
     */
    std::vector<int> roots;

    /**
     * Messages.
     *  This is a [E][2] array; [e][0] is the message from edges[e].src to
     *  edges[e].dst and [e][1] the reverse. Every message sums to one.
     */
    std::vector<crftree_factor_t> messages;

    /**
     * Logarithm of the partition function.
     *  Sum of the log partition of every connected component.
     */
    floatval_t log_norm;

public:
    crft_cliquetree_t() : flag(0), log_norm(0) {}

    size_t num_cliques() const { return this->cliques.size(); }
    size_t num_edges() const { return this->edges.size(); }
    size_t max_clique_size() const
    {
        size_t n = 0;
        for (const auto& c: this->cliques) {
            if (n < c.num_vars()) n = c.num_vars();
        }
        return n;
    }
    floatval_t crftc_lognorm() const { return this->log_norm; }

    int crftc_build(const std::vector<crftree_factor_t>& factors);
    int crftc_calibrate();
    int crftc_find_clique(const std::vector<int>& scope) const;
    void crftc_covering_cliques(const std::vector<int>& scope, std::vector<int>& cliques) const;
    void crftc_marginal(int c, const std::vector<int>& scope, crftree_factor_t& marginal) const;

private:
    int crftc_send_message(int e, int dir, floatval_t *ptr_scale);
    void crftc_schedule(int root, std::vector<int>& order, std::vector<int>& parent_edge) const;
};

#define    MESSAGE(tree, e, dir) \
    ((tree)->messages[2 * (e) + (dir)])

int crftc_debug_calibration(FILE *fp);

/** @} */



/**
 * \defgroup crft_feature.cpp
 */
/** @{ */

/**
 * Feature references.
 *    This is a collection of feature ids used for faster accesses.
 */
struct feature_refs_t {
    int        num_features;    /**< Number of features referred */
    std::vector<int> fids;      /**< Array of feature ids */
public:
    feature_refs_t() : num_features(0) {}
};

/**
 * Group feature ids by the parameter they refer to.
 *  @param  refs        The [P] array that receives the references.
 *  @param  features    The features.
 *  @param  num_params  The number of parameters (P).
 */
void crftf_init_references(
    std::vector<feature_refs_t>& refs,
    const std::vector<crftree_feature_t>& features,
    int num_params
    );

/** @} */



/**
 * \defgroup crft_encode.cpp
 */
/** @{ */

/**
 * Assemble one factor per feature.
 *  The factor of a feature is all ones except exp(theta[param]) at the
 *  entry of its assignment.
 *  @return             A status code (CRFTREEERR_OVERFLOW when exp(theta)
 *                      is not finite).
 */
int crfte_assemble_factors(
    const std::vector<crftree_feature_t>& features,
    const std::vector<floatval_t>& theta,
    int num_hidden_states,
    std::vector<crftree_factor_t>& factors
    );

/**
 * Accumulate the model expectation of every parameter.
 *  Throws std::logic_error when no clique covers the scope of a feature,
 *  or when the consistency check is enabled and covering cliques
 *  disagree.
 *  @param  tree        The calibrated clique tree.
 *  @param  features    The features.
 *  @param  refs        The features grouped by parameter.
 *  @param  opt         The evaluation options.
 *  @param  etheta      The [P] vector that receives the expectations.
 */
void crfte_model_expectation(
    const crft_cliquetree_t& tree,
    const std::vector<crftree_feature_t>& features,
    const std::vector<feature_refs_t>& refs,
    const crfte_option_t& opt,
    std::vector<floatval_t>& etheta
    );

/** @} */

#endif/*__CRFT_H__*/
