#include "pagewright/browser/page_actions.hpp"
#include "pagewright/core/logger.hpp"
#include "pagewright/core/utils.hpp"

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <filesystem>
#include <unordered_map>

namespace pagewright::browser {

namespace net = boost::asio;
namespace fs = std::filesystem;

namespace {

constexpr int kModAlt = 1;
constexpr int kModControl = 2;
constexpr int kModMeta = 4;
constexpr int kModShift = 8;

// Marker returned by call_on_element when the locator matched nothing.
constexpr auto kMissingMarker = "__pagewright_missing__";

auto named_keys() -> const std::unordered_map<std::string, KeyDefinition>& {
    static const std::unordered_map<std::string, KeyDefinition> keys = {
        {"Enter", {"Enter", "Enter", 13, "\r"}},
        {"Tab", {"Tab", "Tab", 9, ""}},
        {"Backspace", {"Backspace", "Backspace", 8, ""}},
        {"Delete", {"Delete", "Delete", 46, ""}},
        {"Escape", {"Escape", "Escape", 27, ""}},
        {"Space", {" ", "Space", 32, " "}},
        {"ArrowUp", {"ArrowUp", "ArrowUp", 38, ""}},
        {"ArrowDown", {"ArrowDown", "ArrowDown", 40, ""}},
        {"ArrowLeft", {"ArrowLeft", "ArrowLeft", 37, ""}},
        {"ArrowRight", {"ArrowRight", "ArrowRight", 39, ""}},
        {"Home", {"Home", "Home", 36, ""}},
        {"End", {"End", "End", 35, ""}},
        {"PageUp", {"PageUp", "PageUp", 33, ""}},
        {"PageDown", {"PageDown", "PageDown", 34, ""}},
        {"Insert", {"Insert", "Insert", 45, ""}},
        {"Shift", {"Shift", "ShiftLeft", 16, ""}},
        {"Control", {"Control", "ControlLeft", 17, ""}},
        {"Alt", {"Alt", "AltLeft", 18, ""}},
        {"Meta", {"Meta", "MetaLeft", 91, ""}},
    };
    return keys;
}

/// Splits UTF-8 text into one string per code point.
auto utf8_chars(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        size_t len = 1;
        if ((lead & 0xE0) == 0xC0) len = 2;
        else if ((lead & 0xF0) == 0xE0) len = 3;
        else if ((lead & 0xF8) == 0xF0) len = 4;
        len = std::min(len, text.size() - i);
        out.emplace_back(text.substr(i, len));
        i += len;
    }
    return out;
}

auto select_by_name(SelectOption::By by) -> std::string_view {
    switch (by) {
        case SelectOption::By::Value: return "value";
        case SelectOption::By::Label: return "label";
        case SelectOption::By::Index: return "index";
        case SelectOption::By::Any: break;
    }
    return "any";
}

} // anonymous namespace

auto key_definition(std::string_view name) -> std::optional<KeyDefinition> {
    auto& keys = named_keys();
    if (auto it = keys.find(std::string(name)); it != keys.end()) {
        return it->second;
    }

    if (name.size() >= 2 && name.size() <= 3 && name[0] == 'F') {
        int n = 0;
        for (auto c : name.substr(1)) {
            if (c < '0' || c > '9') return std::nullopt;
            n = n * 10 + (c - '0');
        }
        if (n >= 1 && n <= 12) {
            return KeyDefinition{std::string(name), std::string(name), 111 + n, ""};
        }
        return std::nullopt;
    }

    if (name.size() == 1) {
        char c = name[0];
        if (c >= 'a' && c <= 'z') {
            auto upper = static_cast<char>(c - 'a' + 'A');
            return KeyDefinition{std::string(1, c), std::string("Key") + upper, upper,
                                 std::string(1, c)};
        }
        if (c >= 'A' && c <= 'Z') {
            return KeyDefinition{std::string(1, c), std::string("Key") + c, c, std::string(1, c)};
        }
        if (c >= '0' && c <= '9') {
            return KeyDefinition{std::string(1, c), std::string("Digit") + c, c,
                                 std::string(1, c)};
        }
        if (c >= 0x20 && c < 0x7f) {
            return KeyDefinition{std::string(1, c), "", 0, std::string(1, c)};
        }
    }
    return std::nullopt;
}

auto modifier_bit(std::string_view name) -> int {
    if (name == "Alt") return kModAlt;
    if (name == "Control") return kModControl;
    if (name == "Meta") return kModMeta;
    if (name == "Shift") return kModShift;
    return 0;
}

PageActions::PageActions(CdpClient& cdp) : cdp_(cdp) {}

// -- Navigation --

auto PageActions::navigate(std::string_view url, int timeout_ms) -> awaitable<Result<void>> {
    auto loaded = std::make_shared<bool>(false);
    cdp_.subscribe("Page.loadEventFired", [loaded](json) { *loaded = true; });

    auto result = co_await cdp_.send_command("Page.navigate", {{"url", std::string(url)}});
    if (!result) {
        cdp_.unsubscribe("Page.loadEventFired");
        co_return make_fail(result.error());
    }
    if (result->contains("errorText")) {
        cdp_.unsubscribe("Page.loadEventFired");
        co_return make_fail(make_error(ErrorCode::BrowserError, "Navigation failed",
                                       (*result)["errorText"].get<std::string>() + " (" +
                                           std::string(url) + ")"));
    }

    // Same-document navigations carry no loaderId and fire no load event.
    if (!result->contains("loaderId")) {
        cdp_.unsubscribe("Page.loadEventFired");
        co_return ok_result();
    }

    auto waited = co_await wait_for_load(loaded, timeout_ms);
    cdp_.unsubscribe("Page.loadEventFired");
    if (!waited) {
        co_return make_fail(waited.error());
    }
    LOG_DEBUG("Navigated to: {}", std::string(url));
    co_return ok_result();
}

auto PageActions::reload(int timeout_ms) -> awaitable<Result<void>> {
    auto loaded = std::make_shared<bool>(false);
    cdp_.subscribe("Page.loadEventFired", [loaded](json) { *loaded = true; });

    auto result = co_await cdp_.send_command("Page.reload");
    if (!result) {
        cdp_.unsubscribe("Page.loadEventFired");
        co_return make_fail(result.error());
    }
    auto waited = co_await wait_for_load(loaded, timeout_ms);
    cdp_.unsubscribe("Page.loadEventFired");
    if (!waited) {
        co_return make_fail(waited.error());
    }
    co_return ok_result();
}

auto PageActions::current_url() -> awaitable<Result<std::string>> {
    auto result = co_await evaluate("window.location.href");
    if (!result) {
        co_return make_fail(result.error());
    }
    if (result->value.is_string()) {
        co_return result->value.get<std::string>();
    }
    co_return std::string{};
}

// -- Interaction --

auto PageActions::click(const Locator& locator, const ClickOptions& options)
    -> awaitable<Result<void>> {
    auto point = co_await visible_point(locator, options.position);
    if (!point) {
        co_return make_fail(point.error());
    }
    auto clicked = co_await click_at(*point, options);
    if (!clicked) {
        co_return make_fail(clicked.error());
    }
    LOG_DEBUG("Clicked {} (count={})", locator.describe(), options.click_count);
    co_return ok_result();
}

auto PageActions::click_at(Point point, const ClickOptions& options) -> awaitable<Result<void>> {
    auto move = co_await dispatch_mouse_event("mouseMoved", point, "none", 0);
    if (!move) {
        co_return make_fail(move.error());
    }

    for (int i = 1; i <= options.click_count; ++i) {
        auto press = co_await dispatch_mouse_event("mousePressed", point, options.button, i);
        if (!press) {
            co_return make_fail(press.error());
        }
        if (options.delay_ms > 0) {
            co_await wait(options.delay_ms);
        }
        auto release = co_await dispatch_mouse_event("mouseReleased", point, options.button, i);
        if (!release) {
            co_return make_fail(release.error());
        }
    }
    co_return ok_result();
}

auto PageActions::fill(const Locator& locator, std::string_view text) -> awaitable<Result<void>> {
    auto cleared = co_await call_on_element(locator, R"JS(el => {
        const editable = el.isContentEditable ||
            el.tagName === 'TEXTAREA' ||
            (el.tagName === 'INPUT' && !['checkbox', 'radio', 'file', 'button', 'submit', 'reset', 'image'].includes(el.type));
        if (!editable) return false;
        el.focus();
        if (el.isContentEditable) {
            el.textContent = '';
        } else {
            el.select();
            el.value = '';
        }
        el.dispatchEvent(new Event('input', { bubbles: true }));
        return true;
    })JS");
    if (!cleared) {
        co_return make_fail(cleared.error());
    }
    if (!cleared->is_boolean() || !cleared->get<bool>()) {
        co_return make_fail(make_error(ErrorCode::BrowserError,
                                       "Element is not an editable field", locator.describe()));
    }

    if (!text.empty()) {
        auto inserted = co_await cdp_.send_command("Input.insertText", {{"text", std::string(text)}});
        if (!inserted) {
            co_return make_fail(inserted.error());
        }
    }

    auto changed = co_await call_on_element(
        locator, "el => { el.dispatchEvent(new Event('change', { bubbles: true })); return true; }");
    if (!changed) {
        co_return make_fail(changed.error());
    }
    LOG_DEBUG("Filled {} ({} bytes)", locator.describe(), text.size());
    co_return ok_result();
}

auto PageActions::type(const Locator& locator, std::string_view text, int delay_ms)
    -> awaitable<Result<void>> {
    auto focused = co_await focus(locator);
    if (!focused) {
        co_return make_fail(focused.error());
    }

    for (const auto& ch : utf8_chars(text)) {
        Result<void> sent;
        if (ch == "\n" || ch == "\r") {
            sent = co_await dispatch_key(*key_definition("Enter"), 0);
        } else if (auto key = key_definition(ch); key && key->key_code != 0) {
            sent = co_await dispatch_key(*key, 0);
        } else {
            sent = co_await insert_char(ch);
        }
        if (!sent) {
            co_return make_fail(sent.error());
        }
        if (delay_ms > 0) {
            co_await wait(delay_ms);
        }
    }

    LOG_DEBUG("Typed into {}: {} bytes", locator.describe(), text.size());
    co_return ok_result();
}

auto PageActions::press(std::string_view key, const std::optional<Locator>& locator)
    -> awaitable<Result<void>> {
    // "Control+Shift+A" style chords; a trailing "+" is the plus key itself.
    std::vector<std::string> parts;
    std::string current;
    for (size_t i = 0; i < key.size(); ++i) {
        if (key[i] == '+' && !current.empty()) {
            parts.push_back(std::move(current));
            current.clear();
        } else {
            current += key[i];
        }
    }
    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    if (parts.empty()) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "Key must not be empty"));
    }

    auto main_key = key_definition(parts.back());
    if (!main_key) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "Unknown key", parts.back()));
    }

    int modifiers = 0;
    std::vector<KeyDefinition> held;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        auto bit = modifier_bit(parts[i]);
        if (bit == 0) {
            co_return make_fail(make_error(ErrorCode::InvalidArgument, "Unknown modifier key",
                                           parts[i]));
        }
        modifiers |= bit;
        held.push_back(*key_definition(parts[i]));
    }

    if (locator) {
        auto focused = co_await focus(*locator);
        if (!focused) {
            co_return make_fail(focused.error());
        }
    }

    for (const auto& mod : held) {
        auto down = co_await cdp_.send_command("Input.dispatchKeyEvent", {
            {"type", "rawKeyDown"},
            {"key", mod.key},
            {"code", mod.code},
            {"windowsVirtualKeyCode", mod.key_code},
            {"modifiers", modifiers},
        });
        if (!down) {
            co_return make_fail(down.error());
        }
    }

    auto pressed = co_await dispatch_key(*main_key, modifiers);
    if (!pressed) {
        co_return make_fail(pressed.error());
    }

    for (auto it = held.rbegin(); it != held.rend(); ++it) {
        auto up = co_await cdp_.send_command("Input.dispatchKeyEvent", {
            {"type", "keyUp"},
            {"key", it->key},
            {"code", it->code},
            {"windowsVirtualKeyCode", it->key_code},
        });
        if (!up) {
            co_return make_fail(up.error());
        }
    }

    LOG_DEBUG("Pressed {}{}", std::string(key),
              locator ? " on " + locator->describe() : std::string(" on page"));
    co_return ok_result();
}

auto PageActions::hover(const Locator& locator) -> awaitable<Result<void>> {
    auto point = co_await visible_point(locator, std::nullopt);
    if (!point) {
        co_return make_fail(point.error());
    }
    co_return co_await dispatch_mouse_event("mouseMoved", *point, "none", 0);
}

auto PageActions::is_checked(const Locator& locator) -> awaitable<Result<bool>> {
    auto state = co_await call_on_element(locator, R"JS(el => ({
        checkable: (el.tagName === 'INPUT' && (el.type === 'checkbox' || el.type === 'radio')) ||
                   el.hasAttribute('aria-checked'),
        checked: el.checked === true || el.getAttribute('aria-checked') === 'true',
    }))JS");
    if (!state) {
        co_return make_fail(state.error());
    }
    if (!state->value("checkable", false)) {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "Element is not a checkbox or radio button",
                                       locator.describe()));
    }
    co_return state->value("checked", false);
}

auto PageActions::check(const Locator& locator, bool assert_only) -> awaitable<Result<void>> {
    auto before = co_await is_checked(locator);
    if (!before) {
        co_return make_fail(before.error());
    }

    if (!assert_only && !*before) {
        auto clicked = co_await click(locator, ClickOptions{});
        if (!clicked) {
            co_return make_fail(clicked.error());
        }
    }

    // Give click handlers a moment to settle before asserting.
    co_await wait(500);

    auto after = co_await is_checked(locator);
    if (!after) {
        co_return make_fail(after.error());
    }
    if (!*after) {
        co_return make_fail(make_error(ErrorCode::AssertionFailed, "Element is not checked",
                                       locator.describe()));
    }
    co_return ok_result();
}

auto PageActions::select_options(const Locator& locator, const std::vector<SelectOption>& options)
    -> awaitable<Result<std::vector<std::string>>> {
    json wanted = json::array();
    for (const auto& opt : options) {
        wanted.push_back({{"by", std::string(select_by_name(opt.by))}, {"value", opt.value}});
    }

    auto script = std::string(R"JS(el => {
        if (el.tagName !== 'SELECT') return { error: 'not-select' };
        const wanted = )JS") + wanted.dump() + R"JS(;
        const all = Array.from(el.options);
        const picked = [];
        for (const w of wanted) {
            const match = all.find((o, i) => {
                if (w.by === 'value') return o.value === w.value;
                if (w.by === 'label') return o.label === w.value || o.text.trim() === w.value;
                if (w.by === 'index') return String(i) === w.value;
                return o.value === w.value || o.label === w.value || o.text.trim() === w.value;
            });
            if (!match) return { error: 'missing', value: w.value };
            picked.push(match);
        }
        if (picked.length > 1 && !el.multiple) return { error: 'not-multiple' };
        for (const o of all) o.selected = picked.includes(o);
        el.dispatchEvent(new Event('input', { bubbles: true }));
        el.dispatchEvent(new Event('change', { bubbles: true }));
        return { selected: picked.map(o => o.value) };
    })JS";

    auto result = co_await call_on_element(locator, script);
    if (!result) {
        co_return make_fail(result.error());
    }

    auto error = result->value("error", "");
    if (error == "not-select") {
        co_return make_fail(make_error(ErrorCode::InvalidArgument, "Element is not a <select>",
                                       locator.describe()));
    }
    if (error == "missing") {
        co_return make_fail(make_error(ErrorCode::NotFound, "Option not found in <select>",
                                       result->value("value", "")));
    }
    if (error == "not-multiple") {
        co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                       "Cannot select several options in a single <select>",
                                       locator.describe()));
    }

    std::vector<std::string> selected;
    for (const auto& v : result->value("selected", json::array())) {
        selected.push_back(v.get<std::string>());
    }
    co_return selected;
}

auto PageActions::set_input_files(const Locator& locator, const std::vector<std::string>& files)
    -> awaitable<Result<void>> {
    json paths = json::array();
    for (const auto& f : files) {
        std::error_code ec;
        auto abs = fs::absolute(f, ec);
        if (ec || !fs::is_regular_file(abs)) {
            co_return make_fail(make_error(ErrorCode::NotFound, "Upload file not found", f));
        }
        paths.push_back(abs.string());
    }

    // DOM.setFileInputFiles needs a remote object, not a by-value result.
    auto handle = co_await cdp_.send_command("Runtime.evaluate", {
        {"expression", element_expression(locator)},
        {"returnByValue", false},
    });
    if (!handle) {
        co_return make_fail(handle.error());
    }
    auto& remote = (*handle)["result"];
    if (!remote.contains("objectId")) {
        co_return make_fail(make_error(ErrorCode::NotFound, "Element not found",
                                       locator.describe()));
    }
    auto object_id = remote["objectId"].get<std::string>();

    auto set = co_await cdp_.send_command("DOM.setFileInputFiles", {
        {"files", paths},
        {"objectId", object_id},
    });
    (void)co_await cdp_.send_command("Runtime.releaseObject", {{"objectId", object_id}});
    if (!set) {
        co_return make_fail(set.error());
    }
    LOG_DEBUG("Set {} file(s) on {}", files.size(), locator.describe());
    co_return ok_result();
}

auto PageActions::focus(const Locator& locator) -> awaitable<Result<void>> {
    auto result = co_await call_on_element(
        locator, "el => { el.focus(); return document.activeElement === el; }");
    if (!result) {
        co_return make_fail(result.error());
    }
    if (!result->is_boolean() || !result->get<bool>()) {
        LOG_DEBUG("Element did not take focus: {}", locator.describe());
    }
    co_return ok_result();
}

auto PageActions::scroll(const std::optional<Locator>& locator, ScrollMethod method, int dx,
                         int dy) -> awaitable<Result<void>> {
    auto page_scroll = "window.scrollBy(" + std::to_string(dx) + ", " + std::to_string(dy) + ")";

    switch (method) {
        case ScrollMethod::ScrollIntoView: {
            if (!locator) {
                co_return make_fail(make_error(ErrorCode::InvalidArgument,
                                               "'scroll_into_view' method requires a locator"));
            }
            auto r = co_await call_on_element(*locator, R"JS(el => {
                const r = el.getBoundingClientRect();
                const inView = r.top >= 0 && r.left >= 0 &&
                    r.bottom <= window.innerHeight && r.right <= window.innerWidth;
                if (!inView) el.scrollIntoView({ block: 'center', inline: 'center', behavior: 'instant' });
                return true;
            })JS");
            if (!r) {
                co_return make_fail(r.error());
            }
            co_return ok_result();
        }
        case ScrollMethod::MouseWheel: {
            if (locator) {
                auto hovered = co_await hover(*locator);
                if (!hovered) {
                    co_return make_fail(hovered.error());
                }
            }
            auto r = co_await cdp_.send_command("Input.dispatchMouseEvent", {
                {"type", "mouseWheel"},
                {"x", mouse_.x},
                {"y", mouse_.y},
                {"deltaX", dx},
                {"deltaY", dy},
            });
            if (!r) {
                co_return make_fail(r.error());
            }
            co_return ok_result();
        }
        case ScrollMethod::Evaluate: {
            if (locator) {
                auto r = co_await call_on_element(
                    *locator, "e => { e.scrollTop += " + std::to_string(dy) +
                                  "; e.scrollLeft += " + std::to_string(dx) + "; return true; }");
                if (!r) {
                    co_return make_fail(r.error());
                }
                co_return ok_result();
            }
            break;
        }
        case ScrollMethod::PageEvaluate:
            break;
    }

    auto r = co_await evaluate(page_scroll);
    if (!r) {
        co_return make_fail(r.error());
    }
    if (r->exception) {
        co_return make_fail(make_error(ErrorCode::BrowserError, "Scroll script failed",
                                       *r->exception));
    }
    co_return ok_result();
}

auto PageActions::drag_and_drop(const Locator& source, const Locator& target)
    -> awaitable<Result<void>> {
    auto from = co_await visible_point(source, std::nullopt);
    if (!from) {
        co_return make_fail(from.error());
    }
    auto to = co_await element_box(target);
    if (!to) {
        co_return make_fail(to.error());
    }
    auto dest = to->center();

    if (auto r = co_await dispatch_mouse_event("mouseMoved", *from, "none", 0); !r) {
        co_return make_fail(r.error());
    }
    if (auto r = co_await dispatch_mouse_event("mousePressed", *from, "left", 1); !r) {
        co_return make_fail(r.error());
    }

    constexpr int steps = 5;
    for (int i = 1; i <= steps; ++i) {
        Point p{from->x + (dest.x - from->x) * i / steps, from->y + (dest.y - from->y) * i / steps};
        auto moved = co_await cdp_.send_command("Input.dispatchMouseEvent", {
            {"type", "mouseMoved"},
            {"x", p.x},
            {"y", p.y},
            {"button", "left"},
            {"buttons", 1},
        });
        if (!moved) {
            co_return make_fail(moved.error());
        }
        mouse_ = p;
    }

    if (auto r = co_await dispatch_mouse_event("mouseReleased", dest, "left", 1); !r) {
        co_return make_fail(r.error());
    }
    LOG_DEBUG("Dragged {} onto {}", source.describe(), target.describe());
    co_return ok_result();
}

// -- Extraction --

auto PageActions::screenshot(const ScreenshotOptions& options) -> awaitable<Result<std::string>> {
    json params = {{"format", options.format}};
    if (options.format == "jpeg") {
        params["quality"] = options.quality;
    }

    if (options.element) {
        auto box = co_await element_box(*options.element);
        if (!box) {
            co_return make_fail(box.error());
        }
        if (box->width <= 0 || box->height <= 0) {
            co_return make_fail(make_error(ErrorCode::BrowserError, "Element has no size",
                                           options.element->describe()));
        }
        params["clip"] = {
            {"x", box->x},
            {"y", box->y},
            {"width", box->width},
            {"height", box->height},
            {"scale", 1},
        };
        params["captureBeyondViewport"] = true;
    } else if (options.full_page) {
        auto metrics = co_await cdp_.send_command("Page.getLayoutMetrics");
        if (!metrics) {
            co_return make_fail(metrics.error());
        }
        auto& content_size = (*metrics)["cssContentSize"];
        params["clip"] = {
            {"x", 0},
            {"y", 0},
            {"width", content_size["width"]},
            {"height", content_size["height"]},
            {"scale", 1},
        };
        params["captureBeyondViewport"] = true;
    }

    auto result = co_await cdp_.send_command("Page.captureScreenshot", params);
    if (!result) {
        co_return make_fail(result.error());
    }
    co_return result->value("data", "");
}

auto PageActions::inner_text(const Locator& locator) -> awaitable<Result<std::string>> {
    auto result = co_await call_on_element(locator, "el => el.innerText");
    if (!result) {
        co_return make_fail(result.error());
    }
    if (result->is_string()) {
        co_return result->get<std::string>();
    }
    co_return std::string{};
}

auto PageActions::element_box(const Locator& locator) -> awaitable<Result<ElementBox>> {
    auto result = co_await call_on_element(locator, R"JS(el => {
        const r = el.getBoundingClientRect();
        return { x: r.left + window.scrollX, y: r.top + window.scrollY, width: r.width, height: r.height };
    })JS");
    if (!result) {
        co_return make_fail(result.error());
    }
    ElementBox box;
    box.x = result->value("x", 0.0);
    box.y = result->value("y", 0.0);
    box.width = result->value("width", 0.0);
    box.height = result->value("height", 0.0);
    co_return box;
}

// -- JavaScript --

auto PageActions::evaluate(std::string_view expression) -> awaitable<Result<EvalResult>> {
    auto result = co_await cdp_.send_command("Runtime.evaluate", {
        {"expression", std::string(expression)},
        {"returnByValue", true},
        {"awaitPromise", true},
    });
    if (!result) {
        co_return make_fail(result.error());
    }

    EvalResult eval_result;
    if (result->contains("exceptionDetails")) {
        auto& exc = (*result)["exceptionDetails"];
        eval_result.exception = exc.value("text", "Unknown exception");
        if (exc.contains("exception") && exc["exception"].contains("description")) {
            eval_result.exception = exc["exception"]["description"].get<std::string>();
        }
    }

    if (result->contains("result")) {
        auto& remote_obj = (*result)["result"];
        if (remote_obj.contains("value")) {
            eval_result.value = remote_obj["value"];
        } else if (remote_obj.contains("description")) {
            eval_result.value = remote_obj["description"];
        }
    }
    co_return eval_result;
}

// -- Waiting --

auto PageActions::wait_for_visible(const Locator& locator, int timeout_ms, int polling_ms)
    -> awaitable<Result<void>> {
    auto expression = "(() => { const el = " + element_expression(locator) + R"JS(;
        if (!el) return false;
        const s = window.getComputedStyle(el);
        const r = el.getBoundingClientRect();
        return s.visibility !== 'hidden' && s.display !== 'none' && r.width > 0 && r.height > 0;
    })())JS";

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        auto result = co_await evaluate(expression);
        if (!result) {
            co_return make_fail(result.error());
        }
        if (result->value.is_boolean() && result->value.get<bool>()) {
            co_return ok_result();
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        co_await wait(polling_ms);
    }

    co_return make_fail(make_error(ErrorCode::Timeout, "Timeout waiting for element to be visible",
                                   locator.describe() + " after " + std::to_string(timeout_ms) +
                                       "ms"));
}

auto PageActions::wait(int ms) -> awaitable<void> {
    net::steady_timer timer(co_await net::this_coro::executor);
    timer.expires_after(std::chrono::milliseconds(ms));
    co_await timer.async_wait(net::use_awaitable);
}

// -- Network --

void RequestCapture::on_request(const json& params) {
    auto id = params.value("requestId", "");
    if (params.contains("request") && params["request"].is_object()) {
        urls_[id] = params["request"].value("url", "");
    }
}

void RequestCapture::on_finished(const json& params) {
    auto it = urls_.find(params.value("requestId", ""));
    if (it == urls_.end()) {
        return;
    }
    if (it->second.find(fragment_) != std::string::npos) {
        LOG_INFO("Captured endpoint: {}", it->second);
        captured_ = it->second;
    }
    urls_.erase(it);
}

auto PageActions::capture_requests(std::string_view url_fragment, const CaptureOptions& options)
    -> awaitable<Result<std::optional<std::string>>> {
    auto fragment = std::string(url_fragment);
    auto state = std::make_shared<RequestCapture>(fragment);

    cdp_.subscribe("Network.requestWillBeSent",
                   [state](json params) { state->on_request(params); });
    cdp_.subscribe("Network.loadingFinished",
                   [state](json params) { state->on_finished(params); });

    Result<void> reloaded;
    if (options.reload) {
        auto r = co_await cdp_.send_command("Page.reload");
        if (!r) {
            reloaded = std::unexpected(r.error());
        }
    }
    if (reloaded) {
        co_await wait(options.wait_ms);
    }

    cdp_.unsubscribe("Network.requestWillBeSent");
    cdp_.unsubscribe("Network.loadingFinished");

    if (!reloaded) {
        co_return make_fail(reloaded.error());
    }
    if (!state->captured()) {
        LOG_INFO("No finished request matched '{}'", fragment);
    }
    co_return state->captured();
}

// -- Private helpers --

auto PageActions::call_on_element(const Locator& locator, std::string_view function_js)
    -> awaitable<Result<json>> {
    auto expression = "(() => { const el = " + element_expression(locator) +
                      "; if (!el) return '" + kMissingMarker + "'; return (" +
                      std::string(function_js) + ")(el); })()";

    auto result = co_await evaluate(expression);
    if (!result) {
        co_return make_fail(result.error());
    }
    if (result->exception) {
        co_return make_fail(make_error(ErrorCode::BrowserError, "Script execution failed",
                                       *result->exception + " [" + locator.describe() + "]"));
    }
    if (result->value.is_string() && result->value.get<std::string>() == kMissingMarker) {
        co_return make_fail(make_error(ErrorCode::NotFound, "Element not found",
                                       locator.describe()));
    }
    co_return result->value;
}

auto PageActions::visible_point(const Locator& locator, const std::optional<Point>& offset)
    -> awaitable<Result<Point>> {
    auto rect = co_await call_on_element(locator, R"JS(el => {
        let r = el.getBoundingClientRect();
        const inView = r.top >= 0 && r.left >= 0 &&
            r.bottom <= window.innerHeight && r.right <= window.innerWidth;
        if (!inView) {
            el.scrollIntoView({ block: 'center', inline: 'center', behavior: 'instant' });
            r = el.getBoundingClientRect();
        }
        return { x: r.left, y: r.top, width: r.width, height: r.height };
    })JS");
    if (!rect) {
        co_return make_fail(rect.error());
    }

    double width = rect->value("width", 0.0);
    double height = rect->value("height", 0.0);
    if (width <= 0 || height <= 0) {
        co_return make_fail(make_error(ErrorCode::BrowserError, "Element is not visible",
                                       locator.describe()));
    }

    double x = rect->value("x", 0.0);
    double y = rect->value("y", 0.0);
    if (offset) {
        co_return Point{x + offset->x, y + offset->y};
    }
    co_return Point{x + width / 2.0, y + height / 2.0};
}

auto PageActions::dispatch_mouse_event(std::string_view type, Point point,
                                       std::string_view button, int click_count)
    -> awaitable<Result<void>> {
    json params = {
        {"type", std::string(type)},
        {"x", point.x},
        {"y", point.y},
        {"button", std::string(button)},
        {"clickCount", click_count},
    };

    auto result = co_await cdp_.send_command("Input.dispatchMouseEvent", params);
    if (!result) {
        co_return make_fail(result.error());
    }
    mouse_ = point;
    co_return ok_result();
}

auto PageActions::dispatch_key(const KeyDefinition& key, int modifiers)
    -> awaitable<Result<void>> {
    // Chords with Control/Alt/Meta are shortcuts and insert no text.
    bool produces_text = !key.text.empty() && (modifiers & (kModAlt | kModControl | kModMeta)) == 0;

    json down = {
        {"type", produces_text ? "keyDown" : "rawKeyDown"},
        {"key", key.key},
        {"code", key.code},
        {"windowsVirtualKeyCode", key.key_code},
        {"nativeVirtualKeyCode", key.key_code},
        {"modifiers", modifiers},
    };
    if (produces_text) {
        down["text"] = key.text;
        down["unmodifiedText"] = key.text;
    }

    auto pressed = co_await cdp_.send_command("Input.dispatchKeyEvent", down);
    if (!pressed) {
        co_return make_fail(pressed.error());
    }

    auto released = co_await cdp_.send_command("Input.dispatchKeyEvent", {
        {"type", "keyUp"},
        {"key", key.key},
        {"code", key.code},
        {"windowsVirtualKeyCode", key.key_code},
        {"nativeVirtualKeyCode", key.key_code},
        {"modifiers", modifiers},
    });
    if (!released) {
        co_return make_fail(released.error());
    }
    co_return ok_result();
}

auto PageActions::insert_char(std::string_view text) -> awaitable<Result<void>> {
    auto result = co_await cdp_.send_command("Input.dispatchKeyEvent", {
        {"type", "char"},
        {"text", std::string(text)},
    });
    if (!result) {
        co_return make_fail(result.error());
    }
    co_return ok_result();
}

auto PageActions::wait_for_load(std::shared_ptr<bool> loaded, int timeout_ms)
    -> awaitable<Result<void>> {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!*loaded) {
        if (std::chrono::steady_clock::now() >= deadline) {
            co_return make_fail(make_error(ErrorCode::Timeout, "Navigation timeout",
                                           std::to_string(timeout_ms) + "ms"));
        }
        co_await wait(50);
    }
    co_return ok_result();
}

} // namespace pagewright::browser
