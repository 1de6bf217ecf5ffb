/*
 *      Clique-tree construction.
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

#include <algorithm>
#include <iterator>
#include <map>
#include <queue>
#include <set>
#include <vector>

#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/kruskal_min_spanning_tree.hpp>

#include <crftree.h>

#include "crft.h"

typedef boost::adjacency_list<boost::vecS, boost::vecS, boost::undirectedS,
        boost::no_property, boost::property<boost::edge_weight_t, int> > clique_graph_t;
typedef boost::graph_traits<clique_graph_t>::edge_descriptor clique_edge_t;

/* Test whether the set A includes the set B. */
static bool dominates(const std::set<int>& A, const std::set<int>& B)
{
    return std::includes(A.begin(), A.end(), B.begin(), B.end());
}

/*
    Triangulate the interaction graph by greedy elimination (fewest
    neighbors first, ties to the lowest variable) and return the maximal
    elimination cliques.
 */
static void eliminate_variables(
    std::vector<std::set<int> >& neighbors,
    std::vector<std::set<int> >& clusters
    )
{
    const int V = neighbors.size();
    std::vector<bool> eliminated(V, false);
    std::vector<std::set<int> > cliques;

    for (int step = 0;step < V;++step) {
        int v = -1;
        for (int i = 0;i < V;++i) {
            if (!eliminated[i] && (v < 0 || neighbors[i].size() < neighbors[v].size())) {
                v = i;
            }
        }

        std::set<int> clique(neighbors[v]);
        clique.insert(v);
        cliques.push_back(clique);

        /* Connect the neighbors of #v and detach #v. */
        for (auto i: neighbors[v]) {
            for (auto j: neighbors[v]) {
                if (i != j) neighbors[i].insert(j);
            }
            neighbors[i].erase(v);
        }
        neighbors[v].clear();
        eliminated[v] = true;
    }

    /* Keep the cliques that no other clique includes. */
    clusters.clear();
    for (const auto& A: cliques) {
        bool found = false;
        for (const auto& B: clusters) {
            if (dominates(B, A)) {
                found = true;
                break;
            }
        }

        if (!found) {
            for (auto it = clusters.begin();it != clusters.end();) {
                if (dominates(A, *it)) {
                    it = clusters.erase(it);
                } else {
                    ++it;
                }
            }
            clusters.push_back(A);
        }
    }
}

int crft_cliquetree_t::crftc_build(const std::vector<crftree_factor_t>& factors)
{
    std::map<int, int> cardinality;

    this->flag = 0;
    this->cliques.clear();
    this->edges.clear();
    this->adjacency.clear();
    this->roots.clear();
    this->messages.clear();
    this->log_norm = 0;

    /* Collect the variables and their cardinalities. */
    for (const auto& f: factors) {
        for (size_t k = 0;k < f.num_vars();++k) {
            auto it = cardinality.find(f.vars[k]);
            if (it == cardinality.end()) {
                cardinality[f.vars[k]] = f.card[k];
            } else if (it->second != f.card[k]) {
                return CRFTREEERR_INCOMPATIBLE;
            }
        }
    }

    /* Local ids follow the ascending order of the variables. */
    std::vector<int> vars;
    std::map<int, int> local;
    for (const auto& vc: cardinality) {
        local[vc.first] = vars.size();
        vars.push_back(vc.first);
    }
    const int V = vars.size();

    /* Interaction graph: variables sharing a factor are neighbors. */
    std::vector<std::set<int> > neighbors(V);
    for (const auto& f: factors) {
        for (auto u: f.vars) {
            for (auto w: f.vars) {
                if (u != w) neighbors[local[u]].insert(local[w]);
            }
        }
    }

    std::vector<std::set<int> > clusters;
    eliminate_variables(neighbors, clusters);
    if (clusters.empty()) {
        /* A model without variables still needs a clique for constants. */
        clusters.push_back(std::set<int>());
    }

    /* Create the cliques with all-one potentials. */
    for (const auto& cluster: clusters) {
        std::vector<int> cv, cc;
        for (auto i: cluster) {
            cv.push_back(vars[i]);
            cc.push_back(cardinality[vars[i]]);
        }
        crftree_factor_t clique;
        int ret = crftree_factor_init(clique, cv, cc, 1.);
        if (ret != CRFTREE_SUCCESS) {
            return ret;
        }
        this->cliques.push_back(clique);
    }
    const int C = this->cliques.size();

    /*
        Join the cliques by a maximum-weight spanning forest over the
        separator sizes. Cliques sharing no variable are never joined.
     */
    clique_graph_t g(C);
    for (int i = 0;i < C;++i) {
        for (int j = i+1;j < C;++j) {
            std::vector<int> sep;
            std::set_intersection(
                this->cliques[i].vars.begin(), this->cliques[i].vars.end(),
                this->cliques[j].vars.begin(), this->cliques[j].vars.end(),
                std::back_inserter(sep));
            if (!sep.empty()) {
                boost::add_edge(i, j, -(int)sep.size(), g);
            }
        }
    }

    std::vector<clique_edge_t> forest;
    boost::kruskal_minimum_spanning_tree(g, std::back_inserter(forest));

    this->adjacency.resize(C);
    for (const auto& ed: forest) {
        crft_edge_t e;
        e.src = boost::source(ed, g);
        e.dst = boost::target(ed, g);
        std::set_intersection(
            this->cliques[e.src].vars.begin(), this->cliques[e.src].vars.end(),
            this->cliques[e.dst].vars.begin(), this->cliques[e.dst].vars.end(),
            std::back_inserter(e.sep));
        this->adjacency[e.src].push_back(this->edges.size());
        this->adjacency[e.dst].push_back(this->edges.size());
        this->edges.push_back(e);
    }
    this->messages.resize(2 * this->edges.size());

    /* The lowest clique of each connected component is its root. */
    std::vector<bool> visited(C, false);
    for (int c = 0;c < C;++c) {
        if (visited[c]) continue;
        this->roots.push_back(c);

        std::queue<int> bfs;
        bfs.push(c);
        visited[c] = true;
        while (!bfs.empty()) {
            int n = bfs.front();
            bfs.pop();
            for (auto e: this->adjacency[n]) {
                int m = (this->edges[e].src == n) ? this->edges[e].dst : this->edges[e].src;
                if (!visited[m]) {
                    visited[m] = true;
                    bfs.push(m);
                }
            }
        }
    }

    /* Multiply every factor into the first clique covering its scope. */
    for (const auto& f: factors) {
        int c = this->crftc_find_clique(f.vars);
        if (c < 0) {
            return CRFTREEERR_INTERNAL_LOGIC;
        }
        int ret = crftree_factor_product(this->cliques[c], f, this->cliques[c]);
        if (ret != CRFTREE_SUCCESS) {
            return ret;
        }
    }

    this->flag = CTF_BUILT;
    return CRFTREE_SUCCESS;
}
