#include <cassert>
#include <iostream>
#include <string>

#include "Errors.h"
#include "Fakes.h"
#include "Notifier.h"

static void testSuccess() {
    FakePlatform platform;
    Notifier notifier(platform, "telephish-test", 15);

    notifier.showNotification("New Message", "You received a new message: hi", "http://x.test");

    assert(platform.shown == 1);
    assert(platform.initialized == 1);
    assert(platform.balanced());

    assert(platform.lastContent.summary == "New Message");
    assert(platform.lastContent.body == "You received a new message: hi\nhttp://x.test");
    assert(platform.actionId == "open");
    assert(platform.actionLabel == "Open browser");
    assert(platform.actionUrl == "http://x.test");

    assert(platform.waited == 1);
    assert(platform.lastWaitTimeout == 15);

    // повторный вызов — повторное уведомление
    notifier.showNotification("New Message", "again", "http://x.test");
    assert(platform.shown == 2);
    assert(platform.balanced());
}

static void testNoActionsCapability() {
    FakePlatform platform;
    platform.caps = {"body"};
    Notifier notifier(platform, "telephish-test", 15);

    notifier.showNotification("t", "b", "http://x.test");
    assert(platform.shown == 1);
    assert(platform.actionId.empty());
    assert(platform.waited == 0);
    assert(platform.balanced());
}

static void testNoWaitWhenDisabled() {
    FakePlatform platform;
    Notifier notifier(platform, "telephish-test", 0);

    notifier.showNotification("t", "b", "http://x.test");
    assert(platform.actionUrl == "http://x.test");
    assert(platform.waited == 0);
}

static void testInitializationFailure() {
    FakePlatform platform;
    platform.failAt = FakePlatform::FailAt::Initialize;
    Notifier notifier(platform, "telephish-test", 0);

    bool thrown = false;
    try {
        notifier.showNotification("t", "b", "http://x.test");
    } catch (const RenderError&) {
        assert(false && "init failure must not be reported as a render failure");
    } catch (const InitializationError&) {
        thrown = true;
    }
    assert(thrown);
    assert(platform.initialized == 0);
    assert(platform.created == 0);
    assert(platform.balanced());
}

static void expectRenderFailure(FakePlatform::FailAt failAt, RenderStep expected) {
    FakePlatform platform;
    platform.failAt = failAt;
    Notifier notifier(platform, "telephish-test", 10);

    bool thrown = false;
    try {
        notifier.showNotification("t", "b", "http://x.test");
    } catch (const RenderError& e) {
        thrown = true;
        assert(e.step() == expected);
        assert(std::string(e.what()).find(renderStepName(expected)) != std::string::npos);
    }
    assert(thrown);
    assert(platform.shown == 0);
    assert(platform.waited == 0);
    assert(platform.initialized == 1);
    assert(platform.balanced());
}

static void testRenderFailures() {
    expectRenderFailure(FakePlatform::FailAt::QueryServer, RenderStep::QueryServer);
    expectRenderFailure(FakePlatform::FailAt::QueryCapabilities, RenderStep::QueryCapabilities);
    expectRenderFailure(FakePlatform::FailAt::CreateNotification, RenderStep::CreateNotification);
    expectRenderFailure(FakePlatform::FailAt::SetContent, RenderStep::SetContent);
    expectRenderFailure(FakePlatform::FailAt::AddAction, RenderStep::AddAction);
    expectRenderFailure(FakePlatform::FailAt::Show, RenderStep::Show);
}

static void testBuildContentFailure() {
    FakePlatform platform;
    Notifier notifier(platform, "telephish-test", 10);

    bool thrown = false;
    try {
        notifier.showNotification("t", "broken \xff\xfe text", "http://x.test");
    } catch (const RenderError& e) {
        thrown = true;
        assert(e.step() == RenderStep::BuildContent);
    }
    assert(thrown);
    assert(platform.created == 1);
    assert(platform.balanced());
}

static void testMarkup() {
    std::vector<std::string> plain{"body"};
    auto c1 = buildContent("T", "a < b & c", "http://x.test/?a=1&b=2", plain);
    assert(c1.body == "a < b & c\nhttp://x.test/?a=1&b=2");

    std::vector<std::string> markup{"body", "body-markup"};
    auto c2 = buildContent("T", "a < b & c", "http://x.test/?a=1&b=2", markup);
    assert(c2.body == "a &lt; b &amp; c\nhttp://x.test/?a=1&amp;b=2");

    std::vector<std::string> links{"body", "body-markup", "body-hyperlinks"};
    auto c3 = buildContent("T", "hi", "http://x.test/\"q\"", links);
    assert(c3.body == "hi\n<a href=\"http://x.test/&quot;q&quot;\">http://x.test/&quot;q&quot;</a>");
    assert(c3.summary == "T");

    assert(escapeMarkup("it's <b>") == "it&#39;s &lt;b&gt;");
    assert(escapeMarkup("").empty());

    assert(isValidUtf8("привет 😀"));
    assert(isValidUtf8(""));
    assert(!isValidUtf8("\xc0\xaf"));
    assert(!isValidUtf8("\xed\xa0\x80"));
    assert(!isValidUtf8("\xe2\x82"));
}

int main() {
    std::cout << "[Test] Notifier..." << std::endl;

    testSuccess();
    testNoActionsCapability();
    testNoWaitWhenDisabled();
    testInitializationFailure();
    testRenderFailures();
    testBuildContentFailure();
    testMarkup();

    std::cout << "[Test] Notifier passed." << std::endl;
    return 0;
}
