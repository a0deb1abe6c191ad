#include <iostream>
#include <cassert>
#include <chrono>
#include <string>
#include <vector>
#include "domain/ImportResolver.hpp"

using archlens::domain::ImportResolver;
using archlens::domain::SourceFile;

namespace {

std::vector<SourceFile> Corpus() {
    return {
        SourceFile("src/app.ts", "import { helper } from './util';\nimport './styles';\n"),
        SourceFile("src/util.ts", "export const helper = 1;"),
        SourceFile("src/models/user.ts", "export class User {}"),
        SourceFile("src/components/index.tsx", "export * from './Button';"),
        SourceFile("src/components/Button.tsx", "import React from 'react';"),
        SourceFile("lib/lodash.js", "module.exports = {};"),
    };
}

void TestExtractImports() {
    std::cout << "[Test] ExtractImports..." << std::endl;
    const std::string content =
        "import React, { useState } from 'react';\n"
        "import * as path from \"path\";\n"
        "import type { User } from '../models/user';\n"
        "import './side-effect';\n"
        "export { a, b } from './reexport';\n"
        "const fs = require('fs');\n"
        "const again = require(\"fs\");\n";

    auto imports = ImportResolver::ExtractImports(content);
    std::vector<std::string> expected = {"react", "path", "../models/user", "./side-effect", "./reexport", "fs"};
    assert(imports == expected);

    assert(ImportResolver::ExtractImports("const x = 1; // no imports here").empty());
    std::cout << "[PASS] ExtractImports" << std::endl;
}

void TestLargeFiles() {
    std::cout << "[Test] ExtractImports on large files..." << std::endl;
    assert(ImportResolver::ExtractImports("import {" + std::string(70000, 'a')).empty());
    assert(ImportResolver::ExtractImports("export {" + std::string(70000, ' ')).empty());

    auto wide = ImportResolver::ExtractImports("import x" + std::string(60000, ' ') + "from 'wide';");
    assert(wide == std::vector<std::string>{"wide"});

    // Unclosed braces repeated all over a file past the scan limit; the real imports sit on top.
    std::string big = "import { a } from './a';\nconst b = require(   'b'   );\n";
    while (big.size() < 70 * 1024) {
        big += "import {" + std::string(100, ' ') + "\n";
    }
    big += "import late from './late';\n";

    const auto start = std::chrono::steady_clock::now();
    auto imports = ImportResolver::ExtractImports(big);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    std::vector<std::string> expected = {"./a", "b"};
    assert(imports == expected);
    assert(elapsed < std::chrono::seconds(2));
    std::cout << "[PASS] ExtractImports on large files" << std::endl;
}

void TestRelativeResolution() {
    std::cout << "[Test] Relative resolution..." << std::endl;
    auto corpus = Corpus();

    auto util = ImportResolver::Resolve("./util", "src/app.ts", corpus);
    assert(util && *util == "src/util.ts");

    auto user = ImportResolver::Resolve("../models/user", "src/components/Button.tsx", corpus);
    assert(user && *user == "src/models/user.ts");

    auto withExtension = ImportResolver::Resolve("./util.ts", "src/app.ts", corpus);
    assert(withExtension && *withExtension == "src/util.ts");

    auto directory = ImportResolver::Resolve("./components", "src/app.ts", corpus);
    assert(directory && *directory == "src/components/index.tsx");

    assert(!ImportResolver::Resolve("./styles", "src/app.ts", corpus));
    assert(!ImportResolver::Resolve("../../../outside", "src/app.ts", corpus));
    std::cout << "[PASS] Relative resolution" << std::endl;
}

void TestBareResolution() {
    std::cout << "[Test] Bare resolution..." << std::endl;
    auto corpus = Corpus();

    auto lodash = ImportResolver::Resolve("lodash", "src/app.ts", corpus);
    assert(lodash && *lodash == "lib/lodash.js");

    assert(!ImportResolver::Resolve("react", "src/components/Button.tsx", corpus));
    assert(!ImportResolver::Resolve("", "src/app.ts", corpus));
    std::cout << "[PASS] Bare resolution" << std::endl;
}

void TestNormalizeRelative() {
    std::cout << "[Test] NormalizeRelative..." << std::endl;
    assert(ImportResolver::NormalizeRelative("./util", "src") == "src/util");
    assert(ImportResolver::NormalizeRelative("../models/user", "src/components") == "src/models/user");
    assert(ImportResolver::NormalizeRelative("./a/./b/../c", "") == "a/c");
    assert(ImportResolver::StripSourceExtension("src/view.tsx") == "src/view");
    assert(ImportResolver::StripSourceExtension("README.md") == "README.md");
    std::cout << "[PASS] NormalizeRelative" << std::endl;
}

} // namespace

int main() {
    TestExtractImports();
    TestLargeFiles();
    TestRelativeResolution();
    TestBareResolution();
    TestNormalizeRelative();
    std::cout << "[Test] All ImportResolver tests passed." << std::endl;
    return 0;
}
