#pragma once

using Hash = struct evp_md_st;
using HashCtx = struct evp_md_ctx_st;
using Key = struct evp_pkey_st;
using KeyCtx = struct evp_pkey_ctx_st;
using LibContext = struct ossl_lib_ctx_st;
