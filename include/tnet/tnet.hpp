//! # tnet: Typed Netstring Codec
//!
//! This is the main public header for the tnet library. It provides a strict,
//! bounded decoder and a canonical encoder for typed netstrings
//! (`length ":" payload tag`).
//!
//! ## Features
//!
//! - **Strict decoding**: Every framing, type and structure violation is an error
//! - **Bounded resources**: Configurable nesting depth and total payload size
//! - **Exact numbers**: 64-bit integers without loss, floats preserved bit for bit
//! - **Ordered dictionaries**: Pair order and duplicate keys are kept
//! - **Fluent builder**: Construct trees with a chainable API
//! - **Typed conversion**: Read and write native C++ types directly
//!
//! ## Quick Start
//!
//! ```cpp
//! #include "tnet/tnet.hpp"
//! using namespace tnet;
//!
//! // Decode
//! auto result = decode("18:5:hello,5:world,]");
//! if (is_ok(result)) {
//!     std::cout << unwrap(result) << std::endl; // ["hello", "world"]
//! }
//!
//! // Build and encode
//! auto msg = ValueBuilder()
//!     .dict()
//!         .key("id").item(7)
//!         .key("ok").item(true)
//!     .end()
//!     .build();
//! auto bytes = encode(msg); // "21:2:id,1:7#2:ok,4:true!}"
//!
//! // Native types
//! auto ids = deserialize<std::vector<int>>("8:1:1#1:2#]");
//! ```
//!
//! ## Module Organization
//!
//! | Header | Contents |
//! |--------|----------|
//! | `common.hpp` | `Result`, `Box`, version constants |
//! | `error.hpp` | `Error`, `ErrorKind` |
//! | `value.hpp` | `Value`, `Integer`, `List`, `Dict` |
//! | `framer.hpp` | `parse_frame`, `write_frame`, `Tag` |
//! | `number.hpp` | Integer and float payload text |
//! | `decoder.hpp` | `Decoder`, `decode`, `decode_prefix` |
//! | `encoder.hpp` | `encode`, `encode_to` |
//! | `builder.hpp` | `ValueBuilder` |
//! | `convert.hpp` | `Converter<T>`, `serialize`, `deserialize` |
//! | `log.hpp` | Diagnostics logger |

#pragma once

#include "tnet/builder.hpp"
#include "tnet/common.hpp"
#include "tnet/convert.hpp"
#include "tnet/decoder.hpp"
#include "tnet/encoder.hpp"
#include "tnet/error.hpp"
#include "tnet/framer.hpp"
#include "tnet/number.hpp"
#include "tnet/value.hpp"
