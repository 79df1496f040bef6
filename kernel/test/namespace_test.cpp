#include "test/namespace_test.hpp"
#include "test/module_fixtures.hpp"
#include "modules/module_identity.hpp"

namespace strata::test {

using namespace strata::modules;
using namespace strata::formats;

static void count_module(ModuleHandle, const char*, void* context) {
    (*static_cast<u32*>(context))++;
}

bool NamespaceTest::run_tests() {
    print_section_header("Namespace Tests");
    
    u32 passedTests = 0;
    u32 totalTests = 6;
    
    if (test_identity_helpers()) passedTests++;
    if (test_boot_names()) passedTests++;
    if (test_layered_lookup()) passedTests++;
    if (test_weak_definitions()) passedTests++;
    if (test_weak_fallback()) passedTests++;
    if (test_prefix_queries()) passedTests++;
    
    print_section_footer("Namespace Tests", passedTests, totalTests);
    return (passedTests == totalTests);
}

bool NamespaceTest::test_identity_helpers() {
    bool testPassed = true;
    print_info("Testing module and symbol hash handling...");
    
    testPassed &= assert_equal<u32>(11, module_name_hashless_length("serial_port-4be8f0a1"), "Module hash not stripped");
    testPassed &= assert_equal<u32>(11, module_name_hashless_length("serial_port"), "Hashless module name changed");
    testPassed &= assert_equal<u32>(9, module_name_hashless_length("trailing-"), "Empty hash stripped");
    
    char buffer[64];
    testPassed &= assert_condition(symbol_name_without_hash("serial_port::init::h5f1c2a9e", buffer, sizeof(buffer)) &&
                                   strcmp(buffer, "serial_port::init") == 0, "Symbol hash not stripped");
    testPassed &= assert_condition(symbol_name_without_hash("serial_port::hello", buffer, sizeof(buffer)) &&
                                   strcmp(buffer, "serial_port::hello") == 0, "Path component taken for a hash");
    testPassed &= assert_condition(!symbol_name_without_hash("serial_port::init::h5f1c2a9e", buffer, 8),
                                   "Short buffer accepted");
    testPassed &= assert_condition(module_name_without_hash("vga-77aa", buffer, sizeof(buffer)) &&
                                   strcmp(buffer, "vga") == 0, "Module name copy mismatch");
    
    testPassed &= assert_condition(symbol_names_match_without_hash("vga::clear::h0123", "vga::clear::habcd"),
                                   "Names differing only by hash do not match");
    testPassed &= assert_condition(!symbol_names_match_without_hash("vga::clear::h0123", "vga::clear_all::h0123"),
                                   "Different names matched");
    
    testPassed &= assert_condition(module_prefix_of_symbol("serial_port::init::h12", buffer, sizeof(buffer)) &&
                                   strcmp(buffer, "serial_port") == 0, "Module prefix mismatch");
    testPassed &= assert_condition(module_prefix_of_symbol("<vga::Writer as fmt::Write>::write_str", buffer, sizeof(buffer)) &&
                                   strcmp(buffer, "vga") == 0, "Impl path prefix mismatch");
    testPassed &= assert_condition(!module_prefix_of_symbol("memcpy", buffer, sizeof(buffer)), "Flat name has a prefix");
    
    // Identity: file stem plus content hash
    static const u8 imageA[] = {1, 2, 3, 4};
    static const u8 imageB[] = {1, 2, 3, 5};
    char identityA[64];
    char identityA2[64];
    char identityB[64];
    testPassed &= assert_condition(make_module_identity("drivers/serial_port.cpp", imageA, sizeof(imageA),
                                                        identityA, sizeof(identityA)), "Identity not derived");
    testPassed &= assert_condition(make_module_identity("drivers/serial_port.cpp", imageA, sizeof(imageA),
                                                        identityA2, sizeof(identityA2)), "Identity not derived");
    testPassed &= assert_condition(make_module_identity("drivers/serial_port.cpp", imageB, sizeof(imageB),
                                                        identityB, sizeof(identityB)), "Identity not derived");
    testPassed &= assert_condition(starts_with(identityA, "serial_port-"), "Identity does not start with the file stem");
    testPassed &= assert_equal<u32>(28, strlen(identityA), "Identity length mismatch");
    testPassed &= assert_condition(strcmp(identityA, identityA2) == 0, "Identity not deterministic");
    testPassed &= assert_condition(strcmp(identityA, identityB) != 0, "Different images share an identity");
    testPassed &= assert_condition(make_module_identity(nullptr, imageA, sizeof(imageA), identityA, sizeof(identityA)) &&
                                   starts_with(identityA, "module-"), "Anonymous identity mismatch");
    testPassed &= assert_condition(!make_module_identity("serial_port.cpp", imageA, sizeof(imageA), identityA, 16),
                                   "Short identity buffer accepted");
    
    print_test_result("Identity Helpers", testPassed);
    return testPassed;
}

bool NamespaceTest::test_boot_names() {
    bool testPassed = true;
    print_info("Testing boot module name parsing...");
    
    BootModuleName parsed = {};
    testPassed &= assert_condition(parse_boot_module_name("ksse#serial_port-4be8.o", parsed), "Kernel name rejected");
    testPassed &= assert_condition(parsed.kind == ModuleKind::KERNEL, "Kind mismatch");
    testPassed &= assert_string_equal("sse", parsed.personality, "Personality mismatch");
    testPassed &= assert_string_equal("serial_port-4be8", parsed.moduleName, "Module name mismatch");
    
    testPassed &= assert_condition(parse_boot_module_name("a#shell.o", parsed), "Application name rejected");
    testPassed &= assert_condition(parsed.kind == ModuleKind::APPLICATION && parsed.personality[0] == '\0' &&
                                   strcmp(parsed.moduleName, "shell") == 0, "Application name mismatch");
    testPassed &= assert_condition(parse_boot_module_name("u#init", parsed) && strcmp(parsed.moduleName, "init") == 0,
                                   "Name without extension rejected");
    
    testPassed &= assert_condition(!parse_boot_module_name("x#foo.o", parsed), "Unknown kind accepted");
    testPassed &= assert_condition(!parse_boot_module_name("kfoo.o", parsed), "Missing delimiter accepted");
    testPassed &= assert_condition(!parse_boot_module_name("k#.o", parsed), "Empty module name accepted");
    
    char name[MAX_NAMESPACE_NAME_LENGTH];
    testPassed &= assert_condition(namespace_name_for(ModuleKind::KERNEL, "", name, sizeof(name)) &&
                                   strcmp(name, "_kernel") == 0, "Root namespace name mismatch");
    testPassed &= assert_condition(namespace_name_for(ModuleKind::KERNEL, "sse", name, sizeof(name)) &&
                                   strcmp(name, "sse_kernel") == 0, "Personality namespace name mismatch");
    testPassed &= assert_condition(namespace_name_for(ModuleKind::EXECUTABLE, "", name, sizeof(name)) &&
                                   strcmp(name, "_executables") == 0, "Executable namespace name mismatch");
    testPassed &= assert_condition(!namespace_name_for(ModuleKind::USERSPACE, "sse", name, 8), "Short buffer accepted");
    
    print_test_result("Boot Names", testPassed);
    return testPassed;
}

bool NamespaceTest::test_layered_lookup() {
    bool testPassed = true;
    print_info("Testing namespace layering and shadowing...");
    
    LinkerFixture fixture;
    Namespace personality("sse_kernel", &fixture.root);
    
    DynamicArray<u8> baseLog;
    DynamicArray<u8> sseLog;
    DynamicArray<u8> consumer;
    testPassed &= build_provider("log.cpp", "log::write", "log::level", 3, baseLog);
    testPassed &= build_provider("log.cpp", "log::write", nullptr, 0, sseLog);
    testPassed &= build_consumer("vga.cpp", "vga::init", "log::write", "log::level", consumer);
    
    ModuleHandle baseHandle = INVALID_MODULE;
    ModuleHandle sseHandle = INVALID_MODULE;
    ModuleHandle vgaHandle = INVALID_MODULE;
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(fixture.root, "log-aaaa", baseLog, baseHandle),
                               "Base provider load failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(personality, "log-bbbb", sseLog, sseHandle),
                               "Shadowing provider load failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(personality, "vga-cccc", consumer, vgaHandle),
                               "Consumer load failed");
    if (!testPassed) {
        print_test_result("Layered Lookup", false);
        return false;
    }
    
    SymbolLocation location = {};
    testPassed &= assert_condition(personality.lookup("log::write", location) && location.section.module == sseHandle,
                                   "Personality lookup not served locally");
    testPassed &= assert_condition(fixture.root.lookup("log::write", location) && location.section.module == baseHandle,
                                   "Root lookup not served by the base module");
    testPassed &= assert_condition(personality.lookup("log::level", location) && location.section.module == baseHandle,
                                   "Lookup did not fall back to the parent");
    testPassed &= assert_condition(!personality.lookup_local("log::level", location), "lookup_local walked the parent");
    testPassed &= assert_condition(!fixture.root.lookup("vga::init", location), "Parent sees child symbols");
    
    // The consumer linked against the nearest definition
    const LoadedModule* vga = fixture.registry.get_module(vgaHandle);
    const LoadedModule* sse = fixture.registry.get_module(sseHandle);
    uintptr_t vgaData = section_address_of(vga, ".data");
    uintptr_t sseText = section_address_of(sse, ".text");
    testPassed &= assert_equal<u64>(sseText + PROVIDER_FUNCTION_OFFSET, read_u64(vgaData + CONSUMER_FUNCTION_POINTER),
                                    "Function pointer not bound to the shadowing module");
    
    // Membership
    ModuleHandle found = INVALID_MODULE;
    testPassed &= assert_condition(personality.contains_module(vgaHandle), "Consumer not a member");
    testPassed &= assert_equal<u32>(2, personality.module_count(), "Personality module count mismatch");
    testPassed &= assert_condition(!personality.get_module("log-aaaa", found, false), "Non-recursive get_module walked up");
    testPassed &= assert_condition(personality.get_module("log-aaaa", found, true) && found == baseHandle,
                                   "Recursive get_module failed");
    testPassed &= assert_condition(personality.get_module_starting_with("log", found, true) && found == sseHandle,
                                   "Prefix module lookup did not prefer the local module");
    
    u32 visited = 0;
    personality.for_each_module(count_module, &visited, true);
    testPassed &= assert_equal<u32>(3, visited, "Recursive module walk count mismatch");
    
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.loader.unload(vgaHandle), "Consumer unload failed");
    testPassed &= assert_equal<u32>(0, fixture.registry.unload_namespace(personality), "Personality not emptied");
    testPassed &= assert_equal<u32>(0, fixture.registry.unload_namespace(fixture.root), "Root not emptied");
    
    print_test_result("Layered Lookup", testPassed);
    return testPassed;
}

bool NamespaceTest::test_weak_definitions() {
    bool testPassed = true;
    print_info("Testing weak and global definition rules...");
    
    LinkerFixture fixture;
    Namespace& ns = fixture.root;
    
    DynamicArray<u8> weakFirst;
    DynamicArray<u8> global;
    DynamicArray<u8> weakLater;
    DynamicArray<u8> globalAgain;
    testPassed &= build_single_export("irq::default_handler", STB_WEAK, weakFirst);
    testPassed &= build_single_export("irq::default_handler", STB_GLOBAL, global);
    testPassed &= build_single_export("irq::default_handler", STB_WEAK, weakLater);
    testPassed &= build_single_export("irq::default_handler", STB_GLOBAL, globalAgain);
    
    ModuleHandle weakHandle = INVALID_MODULE;
    ModuleHandle globalHandle = INVALID_MODULE;
    ModuleHandle laterHandle = INVALID_MODULE;
    ModuleHandle againHandle = INVALID_MODULE;
    SymbolLocation location = {};
    
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(ns, "irq_weak-0001", weakFirst, weakHandle),
                               "Weak definition rejected");
    testPassed &= assert_condition(ns.lookup("irq::default_handler", location) && location.binding == STB_WEAK,
                                   "Weak definition not visible");
    
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(ns, "irq-0002", global, globalHandle),
                               "Global definition did not displace the weak one");
    testPassed &= assert_condition(ns.lookup("irq::default_handler", location) && location.section.module == globalHandle,
                                   "Lookup does not return the global definition");
    
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(ns, "irq_weak-0003", weakLater, laterHandle),
                               "Second weak definition rejected");
    testPassed &= assert_condition(ns.lookup("irq::default_handler", location) && location.section.module == globalHandle,
                                   "Weak definition displaced a global one");
    
    u32 symbols = ns.symbol_count();
    u32 modules = fixture.registry.module_count();
    testPassed &= assert_result(LinkResult::DUPLICATE_SYMBOL, fixture.load(ns, "irq-0004", globalAgain, againHandle),
                               "Duplicate global accepted");
    testPassed &= assert_equal(symbols, ns.symbol_count(), "Failed load changed the symbol map");
    testPassed &= assert_equal(modules, fixture.registry.module_count(), "Failed load changed the module count");
    testPassed &= assert_equal<u32>(TEST_WINDOW_PAGES - 3, fixture.env.get_pages().get_free_page_count(),
                                    "Failed load leaked pages");
    
    // Loading the same module name twice is refused
    testPassed &= assert_result(LinkResult::DUPLICATE_SYMBOL, fixture.load(ns, "irq-0002", weakLater, againHandle),
                               "Duplicate module name accepted");
    
    print_test_result("Weak Definitions", testPassed);
    return testPassed;
}

bool NamespaceTest::test_weak_fallback() {
    bool testPassed = true;
    print_info("Testing weak definitions outliving the global one...");
    
    LinkerFixture fixture;
    Namespace& ns = fixture.root;
    
    DynamicArray<u8> weakFirst;
    DynamicArray<u8> strong;
    DynamicArray<u8> weakLater;
    DynamicArray<u8> consumer;
    testPassed &= build_single_export("alloc::oom", STB_WEAK, weakFirst);
    testPassed &= build_single_export("alloc::oom", STB_GLOBAL, strong);
    testPassed &= build_single_export("alloc::oom", STB_WEAK, weakLater);
    testPassed &= build_consumer("panic.cpp", "panic::out_of_memory", "alloc::oom", nullptr, consumer);
    
    ModuleHandle weakHandle = INVALID_MODULE;
    ModuleHandle strongHandle = INVALID_MODULE;
    ModuleHandle laterHandle = INVALID_MODULE;
    ModuleHandle panicHandle = INVALID_MODULE;
    SymbolLocation location = {};
    
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(ns, "alloc_weak-1", weakFirst, weakHandle),
                               "Weak definition rejected");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(ns, "alloc-2", strong, strongHandle),
                               "Global definition rejected");
    testPassed &= assert_condition(ns.lookup("alloc::oom", location) && location.section.module == strongHandle,
                                   "Global definition not visible");
    testPassed &= assert_equal<u32>(1, ns.symbol_count(), "Hidden definition counted as a name");
    testPassed &= assert_equal<u32>(1, ns.shadowed_count(), "Weak definition not kept behind the global one");
    
    // The weak definition takes over once the global one is gone
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.loader.unload(strongHandle), "Global unload failed");
    testPassed &= assert_condition(ns.lookup("alloc::oom", location) && location.section.module == weakHandle &&
                                   location.binding == STB_WEAK, "Weak definition not restored");
    testPassed &= assert_equal<u32>(1, ns.symbol_count(), "Restored name not counted");
    testPassed &= assert_equal<u32>(0, ns.shadowed_count(), "Restored definition still hidden");
    
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(ns, "panic-3", consumer, panicHandle),
                               "Consumer of the restored definition failed to load");
    const LoadedModule* panic = fixture.registry.get_module(panicHandle);
    testPassed &= assert_condition(panic && panic->strongDependencies.size() == 1 &&
                                   panic->strongDependencies[0].target == weakHandle,
                                   "Consumer not bound to the weak definition");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.loader.unload(panicHandle), "Consumer unload failed");
    
    // Of two weak definitions the survivor becomes visible
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(ns, "alloc_weak-4", weakLater, laterHandle),
                               "Second weak definition rejected");
    testPassed &= assert_condition(ns.lookup("alloc::oom", location) && location.section.module == weakHandle,
                                   "Later weak definition displaced the first");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.loader.unload(weakHandle), "Weak unload failed");
    testPassed &= assert_condition(ns.lookup("alloc::oom", location) && location.section.module == laterHandle,
                                   "Surviving weak definition not restored");
    
    // A hidden definition leaves with its module
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(ns, "alloc-5", strong, strongHandle),
                               "Global reload failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.loader.unload(laterHandle), "Hidden weak unload failed");
    testPassed &= assert_equal<u32>(0, ns.shadowed_count(), "Hidden definition outlived its module");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.loader.unload(strongHandle), "Global unload failed");
    testPassed &= assert_condition(!ns.lookup("alloc::oom", location), "Name outlived every definition");
    testPassed &= assert_equal<u32>(0, ns.symbol_count(), "Symbol map not empty");
    
    print_test_result("Weak Fallback", testPassed);
    return testPassed;
}

bool NamespaceTest::test_prefix_queries() {
    bool testPassed = true;
    print_info("Testing prefix and hash-insensitive queries...");
    
    LinkerFixture fixture;
    Namespace child("_applications", &fixture.root);
    
    DynamicArray<u8> serial;
    DynamicArray<u8> keyboard;
    DynamicArray<u8> shell;
    testPassed &= build_provider("serial.cpp", "serial::init::h1a2b3c", "serial::baud::h4d5e6f", 115200, serial);
    testPassed &= build_provider("keyboard.cpp", "keyboard::init::h777", nullptr, 0, keyboard);
    testPassed &= build_provider("shell.cpp", "shell::run::h999", nullptr, 0, shell);
    
    ModuleHandle serialHandle = INVALID_MODULE;
    ModuleHandle keyboardHandle = INVALID_MODULE;
    ModuleHandle shellHandle = INVALID_MODULE;
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(fixture.root, "serial-01", serial, serialHandle),
                               "Serial load failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(fixture.root, "keyboard-02", keyboard, keyboardHandle),
                               "Keyboard load failed");
    testPassed &= assert_result(LinkResult::SUCCESS, fixture.load(child, "shell-03", shell, shellHandle),
                               "Shell load failed");
    
    SymbolLocation results[4];
    testPassed &= assert_equal<u32>(2, fixture.root.find_symbols_starting_with("serial::", results, 4),
                                    "Prefix match count mismatch");
    testPassed &= assert_equal<u32>(3, child.find_symbols_starting_with("s", results, 4),
                                    "Prefix match across namespaces mismatch");
    
    SymbolLocation location = {};
    testPassed &= assert_condition(child.get_symbol_starting_with("keyboard::", location) &&
                                   location.section.module == keyboardHandle, "Unique prefix not resolved");
    testPassed &= assert_condition(!fixture.root.get_symbol_starting_with("serial::", location),
                                   "Ambiguous prefix resolved");
    
    testPassed &= assert_condition(child.lookup_without_hash("serial::init::h000000", INVALID_MODULE, location) &&
                                   location.section.module == serialHandle, "Hash-insensitive lookup failed");
    testPassed &= assert_condition(!child.lookup_without_hash("serial::init::h000000", serialHandle, location),
                                   "Excluded module matched");
    testPassed &= assert_condition(location.type == STT_FUNC, "Location type lost");
    
    child.dump_symbol_map();
    
    print_test_result("Prefix Queries", testPassed);
    return testPassed;
}

} // namespace strata::test
