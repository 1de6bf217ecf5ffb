/*
 *      Parameter objects.
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

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <vector>

#include <crftree.h>
#include "params.h"

enum {
    PT_NONE = 0,
    PT_INT,
    PT_FLOAT,
};

struct param_t {
    std::string name;
    int         type;
    int         val_i;
    floatval_t  val_f;
    std::string help;
};

struct params_t {
    std::vector<param_t> params;
public:
    param_t* find(const char *name)
    {
        for (auto& p: this->params) {
            if (p.name == name) {
                return &p;
            }
        }
        return NULL;
    }
};

static char *mystrdup(const char *src)
{
    char *dst = (char*)malloc(strlen(src)+1);
    if (dst != NULL) {
        strcpy(dst, src);
    }
    return dst;
}

static std::string value_to_string(const param_t* par)
{
    char buffer[64];
    switch (par->type) {
    case PT_INT:
        snprintf(buffer, sizeof(buffer)-1, "%d", par->val_i);
        break;
    case PT_FLOAT:
        snprintf(buffer, sizeof(buffer)-1, "%g", par->val_f);
        break;
    default:
        buffer[0] = 0;
        break;
    }
    buffer[sizeof(buffer)-1] = 0;
    return std::string(buffer);
}

static int params_addref(crftree_params_t* params)
{
    return crftree_interlocked_increment(&params->nref);
}

static int params_release(crftree_params_t* params)
{
    int count = crftree_interlocked_decrement(&params->nref);
    if (count == 0) {
        delete (params_t*)params->internal;
        delete params;
    }
    return count;
}

static int params_num(crftree_params_t* params)
{
    params_t* pars = (params_t*)params->internal;
    return (int)pars->params.size();
}

static int params_name(crftree_params_t* params, int i, char **ptr_name)
{
    params_t* pars = (params_t*)params->internal;
    if (i < 0 || (int)pars->params.size() <= i) return -1;
    *ptr_name = mystrdup(pars->params[i].name.c_str());
    return 0;
}

static int params_set(crftree_params_t* params, const char *name, const char *value)
{
    params_t* pars = (params_t*)params->internal;
    param_t* par = pars->find(name);
    if (par == NULL) return -1;
    switch (par->type) {
    case PT_INT:
        par->val_i = (value != NULL) ? atoi(value) : 0;
        break;
    case PT_FLOAT:
        par->val_f = (value != NULL) ? (floatval_t)atof(value) : 0.;
        break;
    }
    return 0;
}

static int params_get(crftree_params_t* params, const char *name, char **ptr_value)
{
    params_t* pars = (params_t*)params->internal;
    param_t* par = pars->find(name);
    if (par == NULL) return -1;
    *ptr_value = mystrdup(value_to_string(par).c_str());
    return 0;
}

static int params_set_int(crftree_params_t* params, const char *name, int value)
{
    params_t* pars = (params_t*)params->internal;
    param_t* par = pars->find(name);
    if (par == NULL) return -1;
    if (par->type != PT_INT) return -1;
    par->val_i = value;
    return 0;
}

static int params_set_float(crftree_params_t* params, const char *name, floatval_t value)
{
    params_t* pars = (params_t*)params->internal;
    param_t* par = pars->find(name);
    if (par == NULL) return -1;
    if (par->type != PT_FLOAT) return -1;
    par->val_f = value;
    return 0;
}

/* Every option has a string form; the string accessors convert. */
static int params_set_string(crftree_params_t* params, const char *name, const char *value)
{
    return params_set(params, name, value);
}

static int params_get_int(crftree_params_t* params, const char *name, int *ptr_value)
{
    params_t* pars = (params_t*)params->internal;
    param_t* par = pars->find(name);
    if (par == NULL) return -1;
    if (par->type != PT_INT) return -1;
    *ptr_value = par->val_i;
    return 0;
}

static int params_get_float(crftree_params_t* params, const char *name, floatval_t *ptr_value)
{
    params_t* pars = (params_t*)params->internal;
    param_t* par = pars->find(name);
    if (par == NULL) return -1;
    if (par->type != PT_FLOAT) return -1;
    *ptr_value = par->val_f;
    return 0;
}

static int params_get_string(crftree_params_t* params, const char *name, char **ptr_value)
{
    return params_get(params, name, ptr_value);
}

static int params_help(crftree_params_t* params, const char *name, char **ptr_type, char **ptr_help)
{
    params_t* pars = (params_t*)params->internal;
    param_t* par = pars->find(name);
    if (par == NULL) return -1;
    if (ptr_type != NULL) {
        switch (par->type) {
        case PT_INT:
            *ptr_type = mystrdup("int");
            break;
        case PT_FLOAT:
            *ptr_type = mystrdup("float");
            break;
        default:
            *ptr_type = mystrdup("unknown");
            break;
        }
    }
    if (ptr_help != NULL) {
        *ptr_help = mystrdup(par->help.c_str());
    }
    return 0;
}

static void params_free(crftree_params_t* params, const char *str)
{
    free((char*)str);
}

crftree_params_t* params_create_instance()
{
    crftree_params_t* params = new crftree_params_t;

    params->internal = new params_t;
    params->nref = 1;
    params->addref = params_addref;
    params->release = params_release;
    params->num = params_num;
    params->name = params_name;
    params->set = params_set;
    params->get = params_get;
    params->set_int = params_set_int;
    params->set_float = params_set_float;
    params->set_string = params_set_string;
    params->get_int = params_get_int;
    params->get_float = params_get_float;
    params->get_string = params_get_string;
    params->help = params_help;
    params->free = params_free;

    return params;
}

static param_t* find_or_append(crftree_params_t* params, const char *name)
{
    params_t* pars = (params_t*)params->internal;
    param_t* par = pars->find(name);
    if (par == NULL) {
        pars->params.push_back(param_t());
        par = &pars->params.back();
        par->name = name;
    }
    return par;
}

int params_add_int(crftree_params_t* params, const char *name, int value, const char *help)
{
    param_t* par = find_or_append(params, name);
    par->type = PT_INT;
    par->val_i = value;
    par->val_f = 0.;
    par->help = help;
    return 0;
}

int params_add_float(crftree_params_t* params, const char *name, floatval_t value, const char *help)
{
    param_t* par = find_or_append(params, name);
    par->type = PT_FLOAT;
    par->val_i = 0;
    par->val_f = value;
    par->help = help;
    return 0;
}
