// Copyright (C) 2025 Rob Caelers <rob.caelers@gmail.com>
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#include "caregen/TrustStore.hh"

#include <openssl/x509v3.h>

#include "Logging.hh"
#include "OpenSSLUtils.hh"
#include "caregen/Errors.hh"

namespace caregen
{
  TrustStore::TrustStore(std::shared_ptr<Certificate> anchor)
    : anchor_(std::move(anchor))
    , logger_(Logging::create("caregen:trust_store"))
  {
  }

  const std::shared_ptr<Certificate> &TrustStore::anchor() const
  {
    return anchor_;
  }

  X509_STORE *TrustStore::build_store() const
  {
    openssl::X509StorePtr store(X509_STORE_new());
    if (!store)
      {
        logger_->error("Failed to create X509 store: {}", openssl::last_error());
        return nullptr;
      }

    if (anchor_ && X509_STORE_add_cert(store.get(), anchor_->get_x509()) != 1)
      {
        logger_->error("Failed to add {} to X509 store: {}", anchor_->subject(), openssl::last_error());
        return nullptr;
      }
    return store.release();
  }

  outcome::std_result<void> TrustStore::verify(const Certificate &certificate, const std::string &hostname) const
  {
    openssl::X509StorePtr store(build_store());
    openssl::X509StoreCtxPtr ctx(X509_STORE_CTX_new());
    if (!store || !ctx)
      {
        return make_x509_verify_error(X509_V_ERR_OUT_OF_MEM);
      }

    if (X509_STORE_CTX_init(ctx.get(), store.get(), certificate.get_x509(), nullptr) != 1)
      {
        logger_->error("Failed to initialize X509 store context: {}", openssl::last_error());
        return make_x509_verify_error(X509_V_ERR_UNSPECIFIED);
      }

    X509_VERIFY_PARAM *param = X509_STORE_CTX_get0_param(ctx.get());
    X509_VERIFY_PARAM_set_purpose(param, X509_PURPOSE_SSL_SERVER);
    if (!hostname.empty())
      {
        X509_VERIFY_PARAM_set1_host(param, hostname.c_str(), hostname.size());
      }

    if (X509_verify_cert(ctx.get()) != 1)
      {
        int error = X509_STORE_CTX_get_error(ctx.get());
        logger_->debug("Path validation of {} failed at depth {}: {}",
                       certificate.subject(),
                       X509_STORE_CTX_get_error_depth(ctx.get()),
                       X509_verify_cert_error_string(error));
        return make_x509_verify_error(error);
      }

    logger_->debug("Path validation of {} succeeded", certificate.subject());
    return outcome::success();
  }

  outcome::std_result<void> TrustStore::install(SSL_CTX *ctx) const
  {
    X509_STORE *store = build_store();
    if (store == nullptr)
      {
        return CaError::HandshakeError;
      }

    // SSL_CTX takes ownership
    SSL_CTX_set_cert_store(ctx, store);
    return outcome::success();
  }

} // namespace caregen
