//
// TLSContext.hh
//
// Copyright 2023-Present Couchbase, Inc. All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

// Code adapted from Couchbase's fork of sockpp
// <https://github.com/couchbasedeps/sockpp/blob/couchbase-master/src/mbedtls_context.cpp>
// whose copyright is:

// This file is part of the "sockpp" C++ socket library.
//
// Copyright (c) 2014-2017 Frank Pagliughi
// All rights reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
//
// 1. Redistributions of source code must retain the above copyright notice,
// this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright
// notice, this list of conditions and the following disclaimer in the
// documentation and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
// contributors may be used to endorse or promote products derived from this
// software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
// IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO,
// THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
// PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR
// CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
// EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
// PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
// LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
// NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.


#pragma once
#include "io/mbedtls/TLSSocket.hh"
#include "util/Logging.hh"

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/debug.h>
#include <mbedtls/entropy.h>
#include <mbedtls/error.h>
#include <mbedtls/net_sockets.h>
#include <mbedtls/ssl.h>
#include <mbedtls/x509_crt.h>

#include <cstring>
#include <sys/stat.h>

namespace pubip::io::mbed {
    using namespace std;


    /// Raises a nonzero mbedTLS status as an `MbedError`.
    static inline void check(int status, const char *what) {
        if (status != 0)
            Error::raise(MbedError(status), what);
    }


    /** Client-side TLS settings shared by TLSSockets: protocol defaults, required peer
        verification, the RNG, and the system's trusted roots. Must outlive its sockets. */
    class TLSContext {
    public:
        TLSContext() {
            mbedtls_ssl_config_init(&_config);
            check(mbedtls_ssl_config_defaults(&_config, MBEDTLS_SSL_IS_CLIENT,
                                              MBEDTLS_SSL_TRANSPORT_STREAM,
                                              MBEDTLS_SSL_PRESET_DEFAULT),
                  "configuring TLS");
            mbedtls_ssl_conf_authmode(&_config, MBEDTLS_SSL_VERIFY_REQUIRED);
            mbedtls_ssl_conf_rng(&_config, mbedtls_ctr_drbg_random, randomContext());
            mbedtls_ssl_conf_dbg(&_config, logMessage, nullptr);

            if (mbedtls_x509_crt* roots = systemRoots())
                mbedtls_ssl_conf_ca_chain(&_config, roots, nullptr);
            else
                LNet->warn("No trusted root certificates found; HTTPS requests will fail");
        }

        ~TLSContext()                               {mbedtls_ssl_config_free(&_config);}

        mbedtls_ssl_config* config()                {return &_config;}

    private:
        TLSContext(TLSContext const&) = delete;

        static void logMessage(void*, int level, const char *file, int line, const char *msg) {
            string_view text(msg);
            if (text.ends_with('\n'))
                text.remove_suffix(1);
            if (const char* slash = strrchr(file, '/'))
                file = slash + 1;
            LNet->trace("mbedTLS({}) {} [{}:{}]", level, text, file, line);
        }


        // Process-wide DRBG, seeded once from the platform entropy source.
        static mbedtls_ctr_drbg_context* randomContext() {
            struct Random {
                mbedtls_entropy_context  entropy;
                mbedtls_ctr_drbg_context drbg;
                Random() {
                    static constexpr string_view kPersonalization = "PubIP";
                    mbedtls_entropy_init(&entropy);
                    mbedtls_ctr_drbg_init(&drbg);
                    check(mbedtls_ctr_drbg_seed(&drbg, mbedtls_entropy_func, &entropy,
                                                (const unsigned char*)kPersonalization.data(),
                                                kPersonalization.size()),
                          "seeding the TLS random generator");
                }
            };
            static Random sRandom;
            return &sRandom.drbg;
        }


        // The OS's trusted roots, loaded once; null if none could be found.
        static mbedtls_x509_crt* systemRoots() {
            static mbedtls_x509_crt* sRoots = loadSystemRoots();
            return sRoots;
        }

        static mbedtls_x509_crt* loadSystemRoots() {
            static constexpr const char* kBundleFiles[] = {
                "/etc/ssl/certs/ca-certificates.crt",   // Debian, Ubuntu, Alpine
                "/etc/pki/tls/certs/ca-bundle.crt",     // Fedora, RHEL
                "/etc/ssl/cert.pem",                    // BSD, macOS
            };
            static constexpr const char* kCertDir = "/etc/ssl/certs";

            auto roots = new mbedtls_x509_crt;
            mbedtls_x509_crt_init(roots);

            struct stat st;
            int status = MBEDTLS_ERR_X509_FILE_IO_ERROR;
            for (const char* path : kBundleFiles) {
                if (stat(path, &st) == 0 && S_ISREG(st.st_mode)) {
                    status = mbedtls_x509_crt_parse_file(roots, path);
                    LNet->debug("Loading root certificates from {}: status {}", path, status);
                    if (status >= 0)
                        break;
                }
            }
            if (status < 0 && stat(kCertDir, &st) == 0 && S_ISDIR(st.st_mode)) {
                status = mbedtls_x509_crt_parse_path(roots, kCertDir);
                LNet->debug("Loading root certificates from {}/: status {}", kCertDir, status);
            }

            if (status > 0)
                LNet->debug("Skipped {} unparseable root certificates", status);
            if (roots->version == 0) {
                // nothing was parsed
                mbedtls_x509_crt_free(roots);
                delete roots;
                return nullptr;
            }
            return roots;
        }

        mbedtls_ssl_config  _config;
    };

}
