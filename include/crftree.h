/*
 *      C++ API for CRFtree.
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

#ifndef    __CRFTREE_H__
#define    __CRFTREE_H__

#include <limits.h>
#include <stdio.h>
#include <stdarg.h>
#include <vector>

/**
 * \addtogroup crftree_api CRFtree C++ API
 * @{
 *
 *  The CRFtree API evaluates the negative log-likelihood of a discrete
 *  CRF with tied parameters, and its gradient, by exact inference on a
 *  calibrated clique tree.
 */

/**
 * \addtogroup crftree_misc Miscellaneous definitions and functions
 * @{
 */

/** Version number of CRFtree library. */
#define CRFTREE_VERSION    "0.3.0"

/** Copyright string of CRFtree library. */
#define CRFTREE_COPYRIGHT  "Copyright (c) 2007-2013 Naoaki Okazaki"

/** Type of a float value. */
typedef double floatval_t;

/**
 * Status codes.
 */
enum {
    /** Success. */
    CRFTREE_SUCCESS = 0,
    /** Table too large to allocate. */
    CRFTREEERR_OUTOFMEMORY = INT_MIN,
    /** Incompatible data. */
    CRFTREEERR_INCOMPATIBLE,
    /** Internal error. */
    CRFTREEERR_INTERNAL_LOGIC,
    /** Overflow. */
    CRFTREEERR_OVERFLOW,
    /** Index or value out of range. */
    CRFTREEERR_OUTOFRANGE,
};

/**@}*/



/**
 * \addtogroup crftree_object Object interfaces and utilities.
 * @{
 */

struct tag_crftree_evaluator;
/** CRFtree evaluator interface. */
typedef struct tag_crftree_evaluator crftree_evaluator_t;

struct tag_crftree_params;
/** CRFtree parameter interface. */
typedef struct tag_crftree_params crftree_params_t;

/**@}*/



/**
 * \addtogroup crftree_data Observations, features and factors
 * @{
 */

/**
 * Observations of an instance.
 *  A dense [V][J] matrix whose element [v][j] is the observed state of
 *  the image feature #j at the variable #v. Column 0 is conventionally
 *  all ones (the bias feature).
 */
struct crftree_observation_t {
    /** Number of variables (rows). */
    int                 num_vars;
    /** Number of image features (columns). */
    int                 num_image_features;
    /** Row-major observed states. */
    std::vector<int>    values;
public:
    crftree_observation_t() : num_vars(0), num_image_features(0) {}
    crftree_observation_t(int V, int J) : num_vars(V), num_image_features(J), values(V*J) {}

    int  get(int v, int j) const { return this->values[this->num_image_features * v + j]; }
    void set(int v, int j, int value) { this->values[this->num_image_features * v + j] = value; }
};

/**
 * An indicator feature.
 *  The feature fires when the variables #vars take the states
 *  #assignment, contributing the weight theta[param].
 */
struct crftree_feature_t {
    /** Scope of the feature (distinct variable indices). */
    std::vector<int>    vars;
    /** States of the scope variables, aligned with #vars. */
    std::vector<int>    assignment;
    /** Index of the (possibly shared) parameter. */
    int                 param;
public:
    crftree_feature_t() : param(0) {}
    crftree_feature_t(const std::vector<int>& vars, const std::vector<int>& assignment, int param)
        : vars(vars), assignment(assignment), param(param) {}
};

/**
 * A feature set.
 *  Several features may refer to the same parameter (parameter tying).
 */
struct crftree_featureset_t {
    /** Number of parameters referred by the features. */
    int                             num_params;
    /** Array of the features. */
    std::vector<crftree_feature_t>  features;
public:
    crftree_featureset_t() : num_params(0) {}

    size_t num_features() const { return this->features.size(); }
    void append(const crftree_feature_t& f) { this->features.push_back(f); }
    void clear()
    {
        this->num_params = 0;
        this->features.clear();
    }
};

/**
 * Model parameters shared by every instance.
 */
struct crftree_model_params_t {
    /** Number of states of each hidden variable. */
    int         num_hidden_states;
    /** Number of states of each observed image feature. */
    int         num_observed_states;
    /** Coefficient of the L2 regularization. */
    floatval_t  lambda;
public:
    crftree_model_params_t() : num_hidden_states(26), num_observed_states(2), lambda(0.003) {}
    crftree_model_params_t(int K, int O, floatval_t lambda)
        : num_hidden_states(K), num_observed_states(O), lambda(lambda) {}
};

/**
 * A factor over discrete variables.
 *  The table #val is linearized in mixed radix with the first variable
 *  varying fastest.
 */
struct crftree_factor_t {
    /** Scope of the factor. */
    std::vector<int>        vars;
    /** Cardinality of each scope variable. */
    std::vector<int>        card;
    /** Dense table of the factor values. */
    std::vector<floatval_t> val;
public:
    size_t num_vars() const { return this->vars.size(); }
    size_t num_values() const { return this->val.size(); }
};

/**@}*/



/**
 * \addtogroup crftree_object
 * @{
 */

/**
 * Type of callback function for logging.
 *  @param  user        Pointer to the user-defined data.
 *  @param  format      Format string (compatible with prinf()).
 *  @param  args        Optional arguments for the format string.
 *  @return int         \c 0 to continue; non-zero to cancel.
 */
typedef int (*crftree_logging_callback)(void *user, const char *format, va_list args);

/**
 * CRFtree evaluator interface.
 */
struct tag_crftree_evaluator {
public:
    virtual ~tag_crftree_evaluator() {}

    /**
     * Obtain the pointer to crftree_params_t interface.
     *  @return crftree_params_t*   The pointer to crftree_params_t. The
     *                              caller must release() it.
     */
    virtual tag_crftree_params* params() = 0;

    /**
     * Set the callback function and user-defined data.
     *  @param  user        The pointer to the user-defined data.
     *  @param  cbm         The pointer to the callback function.
     */
    virtual void set_message_callback(void *user, crftree_logging_callback cbm) = 0;

    /**
     * Compute the negative log-likelihood and its gradient for an instance.
     *  The model parameters and options are read from params().
     *  @param  X           The observations of the instance.
     *  @param  y           The true labels of the instance.
     *  @param  theta       The parameter vector.
     *  @param  ptr_nll     The pointer that receives the negative
     *                      log-likelihood.
     *  @param  grad        The vector that receives the gradient.
     *  @return int         The status code.
     */
    virtual int evaluate(
        const crftree_observation_t& X,
        const std::vector<int>& y,
        const std::vector<floatval_t>& theta,
        floatval_t *ptr_nll,
        std::vector<floatval_t>& grad
        ) = 0;

    /**
     * Generate the feature set of an instance with the current options.
     *  @param  X           The observations of the instance.
     *  @param  y           The true labels of the instance.
     *  @param  fs          The feature set that receives the features.
     *  @return int         The status code.
     */
    virtual int features(
        const crftree_observation_t& X,
        const std::vector<int>& y,
        crftree_featureset_t& fs
        ) = 0;
};

/**
 * CRFtree parameter interface.
 */
struct tag_crftree_params {
    /**
     * Pointer to the instance data (internal use only).
     */
    void *internal;

    /**
     * Reference counter (internal use only).
     */
    int nref;

    /**
     * Increment the reference counter.
     *  @param  params      The pointer to this parameter instance.
     *  @return int         The reference count after this increment.
     */
    int (*addref)(crftree_params_t* params);

    /**
     * Decrement the reference counter.
     *  @param  params      The pointer to this parameter instance.
     *  @return int         The reference count after this operation.
     */
    int (*release)(crftree_params_t* params);

    /**
     * Obtain the number of available parameters.
     *  @param  params      The pointer to this parameter instance.
     *  @return int         The number of parameters maintained by this object.
     */
    int (*num)(crftree_params_t* params);

    /**
     * Obtain the name of a parameter.
     *  @param  params      The pointer to this parameter instance.
     *  @param  i           The parameter index.
     *  @param  ptr_name    *ptr_name points to the parameter name.
     *  @return int         \c 0 if the parameter exists, \c -1 if \a i is
     *                      out of range.
     */
    int (*name)(crftree_params_t* params, int i, char **ptr_name);

    /**
     * Set a parameter value.
     *  @param  params      The pointer to this parameter instance.
     *  @param  name        The parameter name.
     *  @param  value       The parameter value in string format.
     *  @return int         \c 0 if the parameter is found, \c -1 otherwise.
     */
    int (*set)(crftree_params_t* params, const char *name, const char *value);

    /**
     * Get a parameter value.
     *  @param  params      The pointer to this parameter instance.
     *  @param  name        The parameter name.
     *  @param  ptr_value   *ptr_value presents the parameter value in string
     *                      format.
     *  @return int         \c 0 if the parameter is found, \c -1 otherwise.
     */
    int (*get)(crftree_params_t* params, const char *name, char **ptr_value);

    /**
     * Set an integer value of a parameter.
     *  @param  params      The pointer to this parameter instance.
     *  @param  name        The parameter name.
     *  @param  value       The parameter value.
     *  @return int         \c 0 if the parameter value is set successfully,
     *                      \c -1 otherwise (unknown parameter or incompatible
     *                      type).
     */
    int (*set_int)(crftree_params_t* params, const char *name, int value);

    /**
     * Set a float value of a parameter.
     *  @param  params      The pointer to this parameter instance.
     *  @param  name        The parameter name.
     *  @param  value       The parameter value.
     *  @return int         \c 0 if the parameter value is set successfully,
     *                      \c -1 otherwise (unknown parameter or incompatible
     *                      type).
     */
    int (*set_float)(crftree_params_t* params, const char *name, floatval_t value);

    /**
     * Set a string value of a parameter.
     *  @param  params      The pointer to this parameter instance.
     *  @param  name        The parameter name.
     *  @param  value       The parameter value.
     *  @return int         \c 0 if the parameter value is set successfully,
     *                      \c -1 otherwise (unknown parameter or incompatible
     *                      type).
     */
    int (*set_string)(crftree_params_t* params, const char *name, const char *value);

    /**
     * Get an integer value of a parameter.
     *  @param  params      The pointer to this parameter instance.
     *  @param  name        The parameter name.
     *  @param  ptr_value   The pointer to a variable that receives the
     *                      integer value.
     *  @return int         \c 0 if the parameter value is obtained
     *                      successfully, \c -1 otherwise (unknown parameter
     *                      or incompatible type).
     */
    int (*get_int)(crftree_params_t* params, const char *name, int *ptr_value);

    /**
     * Get a float value of a parameter.
     *  @param  params      The pointer to this parameter instance.
     *  @param  name        The parameter name.
     *  @param  ptr_value   The pointer to a variable that receives the
     *                      float value.
     *  @return int         \c 0 if the parameter value is obtained
     *                      successfully, \c -1 otherwise (unknown parameter
     *                      or incompatible type).
     */
    int (*get_float)(crftree_params_t* params, const char *name, floatval_t *ptr_value);

    /**
     * Get a string value of a parameter.
     *  @param  params      The pointer to this parameter instance.
     *  @param  name        The parameter name.
     *  @param  ptr_value   *ptr_value presents the parameter value.
     *  @return int         \c 0 if the parameter value is obtained
     *                      successfully, \c -1 otherwise (unknown parameter
     *                      or incompatible type).
     */
    int (*get_string)(crftree_params_t* params, const char *name, char **ptr_value);

    /**
     * Get the help message of a parameter.
     *  @param  params      The pointer to this parameter instance.
     *  @param  name        The parameter name.
     *  @param  ptr_type    The pointer to \c char* to which this function
     *                      store the type of the parameter.
     *  @param  ptr_help    The pointer to \c char* to which this function
     *                      store the help message of the parameter.
     *  @return int         \c 0 if the parameter is found, \c -1 otherwise.
     */
    int (*help)(crftree_params_t* params, const char *name, char **ptr_type, char **ptr_help);

    /**
     * Free the memory block of a string allocated by this object.
     *  @param  params      The pointer to this parameter instance.
     *  @param  str         The pointer to the string.
     */
    void (*free)(crftree_params_t* params, const char *str);
};

/**
 * Create an instance of an object by an interface identifier.
 *  The only interface is "evaluator/tree"; the object must be deleted by
 *  the caller.
 *  @param  iid         The interface identifier.
 *  @param  ptr         The pointer to \c void* that points to the
 *                      instance of the object if successful,
 *                      *ptr points to \c NULL otherwise.
 *  @return int         \c 1 if this function creates an object successfully,
 *                      \c 0 otherwise.
 */
int crftree_create_instance(const char *iid, void **ptr);

/**@}*/



/**
 * \addtogroup crftree_factor Factor primitives
 * @{
 */

/**
 * Convert an assignment to the index into a factor table.
 *  @param  assignment  The states of the scope variables.
 *  @param  card        The cardinalities of the scope variables.
 *  @return int         The index (first variable varying fastest).
 */
int crftree_assignment_to_index(const std::vector<int>& assignment, const std::vector<int>& card);

/**
 * Convert an index into a factor table to the assignment.
 *  @param  index       The index.
 *  @param  card        The cardinalities of the scope variables.
 *  @param  assignment  The vector that receives the states.
 */
void crftree_index_to_assignment(int index, const std::vector<int>& card, std::vector<int>& assignment);

/**
 * Initialize a factor with a constant value.
 *  @return int         The status code (CRFTREEERR_OUTOFMEMORY when the
 *                      table size exceeds INT_MAX, CRFTREEERR_INCOMPATIBLE
 *                      for a non-positive cardinality). The factor is
 *                      untouched on error.
 */
int crftree_factor_init(crftree_factor_t& factor, const std::vector<int>& vars, const std::vector<int>& card, floatval_t value);

/**
 * Sum out variables from a factor.
 *  @param  factor      The factor.
 *  @param  eliminate   The variables to sum out.
 *  @param  result      The factor that receives the marginal; its scope
 *                      is the remaining variables in ascending order.
 */
void crftree_factor_marginalize(const crftree_factor_t& factor, const std::vector<int>& eliminate, crftree_factor_t& result);

/**
 * Multiply two factors.
 *  @param  a           The first factor.
 *  @param  b           The second factor.
 *  @param  result      The factor that receives the product; its scope
 *                      is the union in ascending order.
 *  @return int         The status code (CRFTREEERR_INCOMPATIBLE when the
 *                      cardinalities of a shared variable disagree).
 */
int crftree_factor_product(const crftree_factor_t& a, const crftree_factor_t& b, crftree_factor_t& result);

/** Sum of the factor values. */
floatval_t crftree_factor_sum(const crftree_factor_t& factor);

/**
 * Scale a factor to sum to one.
 *  @return floatval_t  The sum before scaling.
 */
floatval_t crftree_factor_normalize(crftree_factor_t& factor);

/**@}*/



/**
 * \addtogroup crftree_eval Likelihood and gradient
 * @{
 */

/**
 * Generate the tied unary and pairwise features of an instance.
 *  @param  X           The observations.
 *  @param  y           The true labels (length check only).
 *  @param  mp          The model parameters.
 *  @param  pairwise    Non-zero to emit pairwise (transition) features.
 *  @param  fs          The feature set that receives the features.
 *  @return int         The status code (CRFTREEERR_OUTOFMEMORY when the
 *                      parameter count exceeds INT_MAX).
 */
int crftree_generate_features(
    const crftree_observation_t& X,
    const std::vector<int>& y,
    const crftree_model_params_t& mp,
    int pairwise,
    crftree_featureset_t& fs
    );

/**
 * Compute the negative log-likelihood and gradient for a feature set.
 *  @param  fs          The feature set.
 *  @param  y           The true labels.
 *  @param  theta       The parameter vector (fs.num_params elements).
 *  @param  mp          The model parameters.
 *  @param  ptr_nll     The pointer that receives the negative
 *                      log-likelihood.
 *  @param  grad        The vector that receives the gradient.
 *  @return int         The status code.
 */
int crftree_evaluate_featureset(
    const crftree_featureset_t& fs,
    const std::vector<int>& y,
    const std::vector<floatval_t>& theta,
    const crftree_model_params_t& mp,
    floatval_t *ptr_nll,
    std::vector<floatval_t>& grad
    );

/**
 * Compute the negative log-likelihood and gradient for an instance.
 *  This generates the feature set (with pairwise features) and forwards
 *  to crftree_evaluate_featureset().
 */
int crftree_evaluate(
    const crftree_observation_t& X,
    const std::vector<int>& y,
    const std::vector<floatval_t>& theta,
    const crftree_model_params_t& mp,
    floatval_t *ptr_nll,
    std::vector<floatval_t>& grad
    );

/**
 * Compare the analytic gradient with central finite differences.
 *  @param  fs          The feature set.
 *  @param  y           The true labels.
 *  @param  theta       The parameter vector.
 *  @param  mp          The model parameters.
 *  @param  epsilon     The step of the finite differences.
 *  @param  ptr_error   The pointer that receives the maximum absolute
 *                      difference over the parameters.
 *  @return int         The status code.
 */
int crftree_gradient_check(
    const crftree_featureset_t& fs,
    const std::vector<int>& y,
    const std::vector<floatval_t>& theta,
    const crftree_model_params_t& mp,
    floatval_t epsilon,
    floatval_t *ptr_error
    );

/**@}*/



/**
 * \addtogroup crftree_misc Miscellaneous definitions and functions
 * @{
 */

/**
 * Increments the value of the integer variable as an atomic operation.
 *  @param  count       The pointer to the integer variable.
 *  @return             The value after this increment.
 */
int crftree_interlocked_increment(int *count);

/**
 * Decrements the value of the integer variable as an atomic operation.
 *  @param  count       The pointer to the integer variable.
 *  @return             The value after this decrement.
 */
int crftree_interlocked_decrement(int *count);

/**@}*/

/**@}*/

#endif/*__CRFTREE_H__*/
