#include <gtest/gtest.h>

// This test ensures that every public header compiles cleanly when included
// together (common for downstream users).

#include "termoracle/cli/options.hpp"
#include "termoracle/core/buffer.hpp"
#include "termoracle/core/encoding.hpp"
#include "termoracle/core/errors.hpp"
#include "termoracle/core/json.hpp"
#include "termoracle/core/types.hpp"
#include "termoracle/hash/hashing.hpp"
#include "termoracle/net/channel.hpp"
#include "termoracle/net/framing.hpp"
#include "termoracle/net/protocol.hpp"
#include "termoracle/net/websocket.hpp"
#include "termoracle/registry/registry.hpp"
#include "termoracle/schema/examples.hpp"
#include "termoracle/schema/schema.hpp"
#include "termoracle/schema/validator.hpp"
#include "termoracle/session/config.hpp"
#include "termoracle/session/driver.hpp"
#include "termoracle/session/env_probe.hpp"
#include "termoracle/session/recorder.hpp"
#include "termoracle/session/scenario.hpp"
#include "termoracle/trace/trace_io.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
