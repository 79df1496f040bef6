#include "test/registry_test.hpp"
#include "test/module_fixtures.hpp"

namespace strata::test {

using namespace strata::modules;
using namespace strata::formats;

static i32 section_index_of(const LoadedModule* module, const char* name) {
    for (u32 i = 0; i < module->sections.size(); i++) {
        if (strcmp(module->sections[i].name, name) == 0) {
            return static_cast<i32>(i);
        }
    }
    return -1;
}

bool RegistryTest::run_tests() {
    print_section_header("Module Registry Tests");
    
    u32 passedTests = 0;
    u32 totalTests = 5;
    
    if (test_unload_order()) passedTests++;
    if (test_stale_handles()) passedTests++;
    if (test_pins()) passedTests++;
    if (test_address_queries()) passedTests++;
    if (test_namespace_teardown()) passedTests++;
    
    print_section_footer("Module Registry Tests", passedTests, totalTests);
    return (passedTests == totalTests);
}

bool RegistryTest::test_unload_order() {
    bool testPassed = true;
    print_info("Testing that providers outlive their consumers...");
    
    LinkerFixture fixture;
    u32 freePages = fixture.env.get_pages().get_free_page_count();
    u32 freeFrames = fixture.env.get_frames().get_free_frame_count();
    
    DynamicArray<u8> provider;
    DynamicArray<u8> consumer;
    testPassed &= build_provider("rtc.cpp", "rtc::now", "rtc::epoch", 1970, provider);
    testPassed &= build_consumer("clock.cpp", "clock::init", "rtc::now", "rtc::epoch", consumer);
    
    ModuleHandle rtc = INVALID_MODULE;
    ModuleHandle clock = INVALID_MODULE;
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(fixture.root, "rtc-01", provider, rtc),
                               "Provider load failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(fixture.root, "clock-02", consumer, clock),
                               "Consumer load failed");
    testPassed &= assert_equal<u32>(2, fixture.registry.module_count(), "Module count mismatch");
    
    testPassed &= assert_result(LinkResult::MODULE_STILL_IN_USE, fixture.loader.unload(rtc),
                               "Provider unloaded under its consumer");
    testPassed &= assert_condition(fixture.registry.is_live(rtc), "Refused unload killed the provider");
    
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.loader.unload(clock), "Consumer unload failed");
    
    u32 refCount = 1;
    u32 dependents = 1;
    testPassed &= assert_condition(fixture.registry.get_usage(rtc, refCount, dependents), "Provider usage lookup failed");
    testPassed &= assert_equal<u32>(0, refCount, "Consumer unload left a reference");
    testPassed &= assert_equal<u32>(0, dependents, "Consumer unload left dependent records");
    
    SymbolLocation location = {};
    testPassed &= assert_condition(!fixture.root.lookup("clock::init", location), "Unloaded symbol still visible");
    testPassed &= assert_condition(fixture.root.lookup("rtc::now", location), "Provider symbol lost");
    
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.loader.unload(rtc), "Provider unload failed");
    testPassed &= assert_equal<u32>(0, fixture.registry.module_count(), "Modules left behind");
    testPassed &= assert_equal<u32>(0, fixture.root.symbol_count(), "Symbols left behind");
    testPassed &= assert_equal<u32>(0, fixture.root.module_count(), "Namespace members left behind");
    testPassed &= assert_equal(freePages, fixture.env.get_pages().get_free_page_count(), "Pages not returned");
    testPassed &= assert_equal(freeFrames, fixture.env.get_frames().get_free_frame_count(), "Frames not returned");
    testPassed &= assert_equal<u32>(0, fixture.env.get_mapper().get_mapped_page_count(), "Mappings not removed");
    
    print_test_result("Unload Order", testPassed);
    return testPassed;
}

bool RegistryTest::test_stale_handles() {
    bool testPassed = true;
    print_info("Testing handles of unloaded modules...");
    
    LinkerFixture fixture;
    DynamicArray<u8> first;
    DynamicArray<u8> second;
    testPassed &= build_single_export("speaker::beep", STB_GLOBAL, first);
    testPassed &= build_single_export("speaker::tone", STB_GLOBAL, second);
    
    ModuleHandle stale = INVALID_MODULE;
    ModuleHandle fresh = INVALID_MODULE;
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(fixture.root, "speaker-01", first, stale),
                               "First load failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.loader.unload(stale), "First unload failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(fixture.root, "speaker-02", second, fresh),
                               "Second load failed");
    
    // The slot is recycled under a new generation
    testPassed &= assert_equal(stale.index, fresh.index, "Slot not reused");
    testPassed &= assert_condition(stale != fresh, "Recycled handle compares equal");
    testPassed &= assert_condition(!fixture.registry.is_live(stale), "Stale handle reported live");
    testPassed &= assert_condition(fixture.registry.get_module(stale) == nullptr, "Stale handle resolved");
    testPassed &= assert_result(LinkResult::INVALID_HANDLE, fixture.loader.unload(stale), "Stale unload accepted");
    testPassed &= assert_result(LinkResult::INVALID_HANDLE, fixture.registry.pin(stale), "Stale pin accepted");
    testPassed &= assert_result(LinkResult::INVALID_HANDLE, fixture.loader.unload(INVALID_MODULE),
                               "Invalid handle unload accepted");
    testPassed &= assert_condition(fixture.registry.is_live(fresh), "Fresh module not live");
    
    ModuleHandle out = INVALID_MODULE;
    testPassed &= assert_result(LinkResult::INVALID_PARAMETER, fixture.registry.commit(fixture.root, nullptr, out),
                               "Null module committed");
    
    ModuleImage empty = {"empty", nullptr, 0};
    testPassed &= assert_result(LinkResult::INVALID_PARAMETER, fixture.loader.load(fixture.root, empty, out),
                               "Empty image accepted");
    
    print_test_result("Stale Handles", testPassed);
    return testPassed;
}

bool RegistryTest::test_pins() {
    bool testPassed = true;
    print_info("Testing explicit pins...");
    
    LinkerFixture fixture;
    DynamicArray<u8> image;
    testPassed &= build_single_export("mouse::poll", STB_GLOBAL, image);
    
    ModuleHandle mouse = INVALID_MODULE;
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(fixture.root, "mouse-01", image, mouse),
                               "Load failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.registry.pin(mouse), "Pin failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.registry.pin(mouse), "Second pin failed");
    
    u32 refCount = 0;
    u32 dependents = 0;
    testPassed &= assert_condition(fixture.registry.get_usage(mouse, refCount, dependents), "Usage lookup failed");
    testPassed &= assert_equal<u32>(2, refCount, "Pins not counted");
    testPassed &= assert_result(LinkResult::MODULE_STILL_IN_USE, fixture.loader.unload(mouse), "Pinned module unloaded");
    
    fixture.registry.unpin(mouse);
    testPassed &= assert_result(LinkResult::MODULE_STILL_IN_USE, fixture.loader.unload(mouse),
                               "Module unloaded with one pin left");
    fixture.registry.unpin(mouse);
    
    // Unbalanced unpins are reported and ignored
    fixture.registry.unpin(mouse);
    testPassed &= assert_condition(fixture.registry.get_usage(mouse, refCount, dependents), "Usage lookup failed");
    testPassed &= assert_equal<u32>(0, refCount, "Unbalanced unpin underflowed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.loader.unload(mouse), "Unpinned module not unloaded");
    
    print_test_result("Pins", testPassed);
    return testPassed;
}

bool RegistryTest::test_address_queries() {
    bool testPassed = true;
    print_info("Testing address to module queries...");
    
    LinkerFixture fixture;
    DynamicArray<u8> provider;
    DynamicArray<u8> consumer;
    testPassed &= build_provider("ps2.cpp", "ps2::read", "ps2::status", 0, provider);
    testPassed &= build_consumer("kbd.cpp", "kbd::init", "ps2::read", nullptr, consumer);
    
    ModuleHandle ps2 = INVALID_MODULE;
    ModuleHandle kbd = INVALID_MODULE;
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(fixture.root, "ps2-01", provider, ps2),
                               "Provider load failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(fixture.root, "kbd-02", consumer, kbd),
                               "Consumer load failed");
    const LoadedModule* module = fixture.registry.get_module(ps2);
    if (!module) {
        print_test_result("Address Queries", false);
        return false;
    }
    
    uintptr_t text = section_address_of(module, ".text");
    uintptr_t data = section_address_of(module, ".data");
    
    SectionRef section = {};
    testPassed &= assert_condition(fixture.registry.get_section_containing_address(text + 20, section),
                                   "Code address not found");
    testPassed &= assert_condition(section.module == ps2, "Code address owner mismatch");
    testPassed &= assert_equal(section_index_of(module, ".text"), static_cast<i32>(section.sectionIndex),
                               "Code section mismatch");
    testPassed &= assert_condition(fixture.registry.get_section_containing_address(data, section) &&
                                   section.sectionIndex == static_cast<u32>(section_index_of(module, ".data")),
                                   "Data address not found");
    
    // Page padding after a section belongs to no section
    testPassed &= assert_condition(!fixture.registry.get_section_containing_address(text + 32, section),
                                   "Padding attributed to a section");
    testPassed &= assert_condition(!fixture.registry.get_section_containing_address(0x1000, section),
                                   "Foreign address attributed to a module");
    
    ModuleHandle owner = INVALID_MODULE;
    testPassed &= assert_condition(fixture.registry.get_module_containing_address(text + 16, owner) && owner == ps2,
                                   "Module lookup by address failed");
    
    uintptr_t address = 0;
    u64 size = 0;
    SectionRef textRef = {ps2, static_cast<u32>(section_index_of(module, ".text"))};
    testPassed &= assert_condition(fixture.registry.section_address(textRef, address, size), "Section address failed");
    testPassed &= assert_equal<u64>(text, address, "Section address mismatch");
    testPassed &= assert_equal<u64>(32, size, "Section size mismatch");
    
    SectionRef bogus = {ps2, 40};
    testPassed &= assert_condition(!fixture.registry.section_address(bogus, address, size), "Bogus section resolved");
    
    ModuleHandle related[2];
    testPassed &= assert_equal<u32>(0, fixture.registry.modules_depended_on_by(ps2, related, 2),
                                    "Provider has dependencies");
    testPassed &= assert_equal<u32>(0, fixture.registry.modules_dependent_on(kbd, related, 2),
                                    "Consumer has dependents");
    testPassed &= assert_equal<u32>(1, fixture.registry.modules_dependent_on(ps2, related, 2),
                                    "Provider dependent count mismatch");
    
    print_test_result("Address Queries", testPassed);
    return testPassed;
}

bool RegistryTest::test_namespace_teardown() {
    bool testPassed = true;
    print_info("Testing namespace teardown...");
    
    LinkerFixture fixture;
    Namespace drivers("drv_kernel", &fixture.root);
    
    DynamicArray<u8> bus;
    DynamicArray<u8> device;
    DynamicArray<u8> client;
    DynamicArray<u8> user;
    testPassed &= build_provider("usb.cpp", "usb::submit", "usb::ports", 4, bus);
    testPassed &= build_consumer("hid.cpp", "hid::init", "usb::submit", "usb::ports", device);
    testPassed &= build_consumer("tablet.cpp", "tablet::init", "hid::init", nullptr, client);
    testPassed &= build_consumer("storage.cpp", "storage::init", "usb::submit", nullptr, user);
    
    ModuleHandle handles[4] = {INVALID_MODULE, INVALID_MODULE, INVALID_MODULE, INVALID_MODULE};
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(fixture.root, "usb-01", bus, handles[0]),
                               "Bus load failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(fixture.root, "hid-02", device, handles[1]),
                               "Device load failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(fixture.root, "tablet-03", client, handles[2]),
                               "Client load failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(drivers, "storage-04", user, handles[3]),
                               "Child namespace load failed");
    
    // A provider used from the child namespace survives the parent teardown
    testPassed &= assert_equal<u32>(1, fixture.registry.unload_namespace(fixture.root), "Root teardown count mismatch");
    testPassed &= assert_condition(fixture.registry.is_live(handles[0]), "Referenced provider unloaded");
    testPassed &= assert_condition(!fixture.registry.is_live(handles[1]) && !fixture.registry.is_live(handles[2]),
                                   "Unreferenced modules survived");
    
    testPassed &= assert_equal<u32>(0, fixture.registry.unload_namespace(drivers), "Child teardown incomplete");
    testPassed &= assert_equal<u32>(0, fixture.registry.unload_namespace(fixture.root), "Root teardown incomplete");
    testPassed &= assert_equal<u32>(0, fixture.registry.module_count(), "Modules left behind");
    
    // Modules of a namespace that goes away first are detached from it
    Namespace* scratch = new Namespace("scratch_kernel", &fixture.root);
    ModuleHandle orphan = INVALID_MODULE;
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(*scratch, "usb-05", bus, orphan),
                               "Scratch load failed");
    fixture.registry.forget_namespace(*scratch);
    delete scratch;
    
    const LoadedModule* module = fixture.registry.get_module(orphan);
    testPassed &= assert_condition(module && module->get_namespace() == nullptr, "Module still bound to its namespace");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.loader.unload(orphan), "Orphan unload failed");
    
    print_test_result("Namespace Teardown", testPassed);
    return testPassed;
}

} // namespace strata::test
