#include "fragments.h"

#include "html_inject.h"
#include "log.h"
#include "util.h"

#include "tbb/parallel_for.h"

#include <exception>
#include <utility>

namespace mosaic {

namespace {

constexpr char kMissingSecretsText[]{ "missing secrets for fragment" };
constexpr char kRenderFailedText[]{ "fragment render failed" };

fragment_context make_context(std::optional<session_info> const &session,
                              std::string_view tenant,
                              std::string_view route) {
  return { .tenant_ctx = std::string(tenant),
           .user_ctx = session && session->user_id ? *session->user_id : kAnonymousUser,
           .route = std::string(route),
           .session_id = session ? session->session_id : std::string{} };
}

// nullopt: skip this binding.
std::optional<std::string> classify(render_outcome outcome, fragment_target const &target) {
  auto const &binding{ target.binding };
  return std::visit(
      match{
          [](fragment_markup &m) -> std::optional<std::string> { return std::move(m.html); },
          [&](fragment_no_opinion const &) -> std::optional<std::string> {
            log::debug("fragment %s: no renderer produced markup", binding.id.c_str());
            return std::nullopt;
          },
          [&](fragment_missing_secrets const &e) -> std::optional<std::string> {
            log::warn("fragment %s (selector %s, assets %s) missing secrets: %s",
                      binding.id.c_str(),
                      binding.selector.c_str(),
                      target.assets_root.string().c_str(),
                      e.message.c_str());
            return fragment_placeholder(binding.id, kMissingSecretsText);
          },
          [&](fragment_failed const &e) -> std::optional<std::string> {
            log::error("fragment %s (selector %s, assets %s) renderer failed: %s",
                       binding.id.c_str(),
                       binding.selector.c_str(),
                       target.assets_root.string().c_str(),
                       e.message.c_str());
            return fragment_placeholder(binding.id, kRenderFailedText);
          },
      },
      outcome);
}

}  // namespace

std::string fragment_placeholder(std::string_view fragment_id, std::string_view message) {
  std::string html{ "<div class=\"fragment-error\" data-fragment-id=\"" };
  for (char const c : fragment_id) {
    switch (c) {
      case '&': html.append("&amp;"); break;
      case '"': html.append("&quot;"); break;
      case '<': html.append("&lt;"); break;
      default: html.push_back(c); break;
    }
  }
  html.append("\">").append(message).append("</div>");
  return html;
}

std::string inject_fragments(std::string html,
                             std::vector<fragment_target> const &targets,
                             std::optional<session_info> const &session,
                             std::string_view tenant,
                             std::string_view route,
                             fragment_renderer &renderer) {
  if (targets.empty()) { return html; }

  fragment_context const ctx{ make_context(session, tenant, route) };

  std::vector<std::optional<std::string>> rendered(targets.size());
  tbb::parallel_for(std::size_t{ 0 }, targets.size(), [&](std::size_t i) {
    auto const &target{ targets[i] };
    render_outcome outcome{ fragment_no_opinion{} };
    try {
      outcome = renderer.render(target.binding, target.assets_root, ctx);
    } catch (std::exception const &e) {
      outcome = fragment_failed{ e.what() };
    }
    rendered[i] = classify(std::move(outcome), target);
  });

  std::optional<html_document> doc;
  std::size_t applied{ 0 };

  for (std::size_t i{ 0 }; i < targets.size(); ++i) {
    if (!rendered[i]) { continue; }
    auto const &binding{ targets[i].binding };

    try {
      if (!doc) { doc = html_document::parse(html); }

      xmlNode *const node{ doc->select_first(css_selector_parse(binding.selector)) };
      if (!node) {
        log::warn("fragment %s: selector '%s' matched nothing",
                  binding.id.c_str(),
                  binding.selector.c_str());
        continue;
      }

      doc->replace_children(node, *rendered[i]);
      ++applied;
    } catch (std::runtime_error const &e) {
      log::warn("fragment %s: failed to inject html: %s", binding.id.c_str(), e.what());
    }
  }

  if (applied == 0) { return html; }
  return doc->serialize();
}

}  // namespace mosaic
