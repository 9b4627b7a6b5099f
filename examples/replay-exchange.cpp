#include <filterlet/action.hpp>
#include <filterlet/attribute-propagator.hpp>
#include <filterlet/fake-host.hpp>
#include <filterlet/host-constants.hpp>
#include <filterlet/http-context.hpp>
#include <filterlet/json-codec.hpp>
#include <filterlet/log.hpp>
#include <filterlet/plugin-options.hpp>
#include <filterlet/plugin-runtime.hpp>
#include <filterlet/plugin.hpp>
#include <filterlet/value.hpp>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

using namespace filterlet;

namespace {

// Masks a configured word in the response body and records how many times it was found.
struct MaskConfig {
  std::string word;
  std::string replacement;
};

void ParseMaskConfig(const Json &json, MaskConfig &config, ParseContext &ctx) {
  const auto word = StringMember(json, "word");
  if (!word || word->empty()) {
    throw std::invalid_argument("'word' is required");
  }
  config.word = *word;
  config.replacement = StringMember(json, "replacement").value_or("***");
  ctx.registerTick(Millis{1000}, [&log = ctx.log()] { log.info("mask plugin alive"); });
}

std::string Mask(HttpContext &ctx, const MaskConfig &config, std::string_view chunk, bool isLastChunk, Logger &log) {
  std::string out(chunk);
  int64_t nbMasked = 0;
  for (auto pos = out.find(config.word); pos != std::string::npos;
       pos = out.find(config.word, pos + config.replacement.size())) {
    out.replace(pos, config.word.size(), config.replacement);
    ++nbMasked;
  }
  if (const Value *pPrev = ctx.getContext("masked"); pPrev != nullptr && pPrev->asInt() != nullptr) {
    nbMasked += *pPrev->asInt();
  }
  ctx.setContext("masked", nbMasked);
  if (isLastChunk) {
    log.debug("masked {} occurrences", nbMasked);
  }
  return out;
}

}  // namespace

int main(int argc, char **argv) {
  const std::string_view pluginConfig =
      argc > 1 ? std::string_view(argv[1]) : std::string_view(R"({"word": "secret", "replacement": "[redacted]"})");

  try {
    test::FakeHost host(pluginConfig);

    PluginOptions<MaskConfig> options;
    options.parseConfigBy(ParseMaskConfig)
        .processStreamingResponseBodyBy(Mask)
        .processStreamDoneBy([](HttpContext &ctx, const MaskConfig &, Logger &log) {
          if (const Value *pMasked = ctx.getContext("masked"); pMasked != nullptr) {
            ctx.setUserAttribute("masked", *pMasked);
          }
          if (ctx.writeUserAttributeToLog() != AttributeExportStatus::Ok) {
            log.warn("masked count was not exported");
          }
        });

    Plugin<MaskConfig> plugin(host, "mask", std::move(options));
    PluginRuntime<MaskConfig> runtime(plugin);
    if (runtime.onStart() != StartStatus::Ok) {
      std::cerr << "Plugin start failed with configuration: " << pluginConfig << '\n';
      return EXIT_FAILURE;
    }

    static constexpr std::uint32_t kContextId = 1;

    host.setHeader(Direction::Request, header::Path, "/chat");
    host.setHeader(Direction::Request, header::Authority, "localhost");
    runtime.onRequestHeaders(kContextId, 2, true);
    runtime.onResponseHeaders(kContextId, 1, false);
    test::SendBody(host, runtime, kContextId, Direction::Response, "the secret is ", false);
    test::SendBody(host, runtime, kContextId, Direction::Response, "that secret stays secret", true);
    runtime.onStreamDone(kContextId);

    std::cout << "Forwarded response body: " << host.body(Direction::Response).forwarded << '\n';
    if (const std::string *pLog = host.findProperty(property::CustomLog); pLog != nullptr) {
      std::cout << property::CustomLog << ": " << *pLog << '\n';
    }
  } catch (const std::exception &e) {
    std::cerr << "Replay encountered error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
