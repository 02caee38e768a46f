#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "cmdvec/assets/error.hpp"
#include "cmdvec/catalog/catalog.hpp"
#include "cmdvec/text/tokenizer.hpp"

namespace {

namespace assets = cmdvec::assets;
namespace catalog = cmdvec::catalog;
using Strings = std::vector<std::string>;

std::vector<catalog::CommandRecord> parse_yaml(const std::string &content) {
  auto parsed = catalog::parse_yaml_catalog(content);
  if (!parsed.ok()) {
    throw std::runtime_error(parsed.error());
  }
  return parsed.take();
}

} // namespace

void register_catalog_tests(std::vector<cmdvec::tests::TestCase> &tests) {
  using cmdvec::tests::require;

  tests.push_back({"yaml_catalog_reads_commands_mapping", [] {
                     const auto records = parse_yaml("commands:\n"
                                                     "  - command: \"ls -la\"\n"
                                                     "    description: List all files\n"
                                                     "    keywords: [\"list\", \"files\"]\n"
                                                     "    tags: [fs]\n"
                                                     "    niche: core\n"
                                                     "    platform: [linux, macos]\n"
                                                     "    pipeline: false\n"
                                                     "  - command: \"grep -r foo . | wc -l\"\n"
                                                     "    description: Count matches\n"
                                                     "    keywords: [\"count\", \"search\"]\n"
                                                     "    pipeline: true\n");
                     require(records.size() == 2, "two records expected");
                     require(records[0].command == "ls -la", "command");
                     require(records[0].description == "List all files", "description");
                     require(records[0].keywords == Strings{"list", "files"}, "keywords");
                     require(records[0].tags == Strings{"fs"}, "tags");
                     require(records[0].niche == "core", "niche");
                     require(records[0].platform == Strings{"linux", "macos"}, "platform");
                     require(!records[0].pipeline, "pipeline false");
                     require(records[1].command == "grep -r foo . | wc -l", "pipe inside quotes");
                     require(records[1].pipeline, "pipeline true");
                   }});

  tests.push_back({"yaml_catalog_reads_top_level_sequence", [] {
                     const auto records = parse_yaml("- command: pwd\n"
                                                     "  description: Print working directory\n"
                                                     "- command: whoami\n");
                     require(records.size() == 2, "two records expected");
                     require(records[1].command == "whoami", "second command");
                     require(records[1].description.empty(), "absent description is empty");
                     require(records[1].keywords.empty(), "absent keywords are empty");
                   }});

  tests.push_back({"yaml_catalog_reads_block_sequences", [] {
                     const auto records = parse_yaml("- command: tar -xzf archive.tar.gz\n"
                                                     "  keywords:\n"
                                                     "    - extract\n"
                                                     "    - \"archive\"\n"
                                                     "    - 'gzip'\n"
                                                     "  platform:\n"
                                                     "  - linux\n");
                     require(records[0].keywords == Strings{"extract", "archive", "gzip"},
                             "block keywords");
                     require(records[0].platform == Strings{"linux"}, "same-indent block list");
                   }});

  tests.push_back({"yaml_catalog_handles_quoting_and_comments", [] {
                     const auto records =
                         parse_yaml("# generated catalog\n"
                                    "commands:\n"
                                    "  - command: 'echo ''hi'''  # greet\n"
                                    "    description: \"Tab\\tand \\\"quotes\\\" and caf\\u00e9\"\n"
                                    "    keywords: [\"a, b\", c#d]\n");
                     require(records[0].command == "echo 'hi'", "single-quote escaping");
                     require(records[0].description == "Tab\tand \"quotes\" and caf\xc3\xa9",
                             "double-quote escapes");
                     require(records[0].keywords == Strings{"a, b", "c#d"},
                             "comma inside quotes and # without leading space");
                   }});

  tests.push_back({"yaml_catalog_decodes_yaml_escapes", [] {
                     const auto records =
                         parse_yaml("- command: \"\\x41BC \\U0001F600 tab\\eend\"\n"
                                    "  description: \"joined\\\n"
                                    "      here \\N\\_ \\L\\P\"\n"
                                    "  keywords: [\"\\x2Fusr\", \"a\\qb\", \"nul\\0sep\"]\n");
                     require(records[0].command == "ABC \xF0\x9F\x98\x80 tab\x1b"
                                                   "end",
                             "hex, 32-bit and escape-character escapes");
                     require(cmdvec::text::tokenize(records[0].command) == Strings{"abc", "tab", "end"},
                             "escapes decode before tokenizing");
                     require(records[0].description ==
                                 "joinedhere \xC2\x85\xC2\xA0 \xE2\x80\xA8\xE2\x80\xA9",
                             "escaped line break and unicode line escapes");
                     require(records[0].keywords == Strings{"/usr", "a\\qb", std::string("nul\0sep", 7)},
                             "unknown escapes stay verbatim");
                   }});

  tests.push_back({"yaml_catalog_reads_block_scalars", [] {
                     const auto records = parse_yaml("- command: make\n"
                                                     "  description: >-\n"
                                                     "    Build the default\n"
                                                     "    target\n"
                                                     "  niche: |\n"
                                                     "    line one\n"
                                                     "    line two\n");
                     require(records[0].description == "Build the default target", "folded");
                     require(records[0].niche == "line one\nline two\n", "literal keeps newlines");
                   }});

  tests.push_back({"yaml_catalog_continues_multiline_values", [] {
                     const auto records = parse_yaml("- command: rsync -av src/ dst/\n"
                                                     "  description: Copy a tree\n"
                                                     "    preserving attributes\n"
                                                     "  keywords: [\"sync\",\n"
                                                     "    \"copy\"]\n");
                     require(records[0].description == "Copy a tree preserving attributes",
                             "plain scalar continuation");
                     require(records[0].keywords == Strings{"sync", "copy"}, "flow list across lines");
                   }});

  tests.push_back({"yaml_catalog_scalar_keywords_become_single_item", [] {
                     const auto records = parse_yaml("- command: top\n  keywords: processes\n");
                     require(records[0].keywords == Strings{"processes"}, "scalar keyword list");
                   }});

  tests.push_back({"yaml_catalog_keeps_duplicate_keywords", [] {
                     const auto records = parse_yaml("- command: ps\n  keywords: [proc, proc]\n");
                     require(records[0].keywords == Strings{"proc", "proc"}, "duplicates preserved");
                   }});

  tests.push_back({"yaml_catalog_ignores_unknown_keys", [] {
                     const auto records = parse_yaml("version: 3\n"
                                                     "commands:\n"
                                                     "  - command: df -h\n"
                                                     "    source: tldr\n"
                                                     "    meta:\n"
                                                     "      added: 2024\n"
                                                     "generated_by: builder\n");
                     require(records.size() == 1, "one record expected");
                     require(records[0].command == "df -h", "command");
                   }});

  tests.push_back({"yaml_catalog_empty_commands_list", [] {
                     require(parse_yaml("commands: []\n").empty(), "flow empty list");
                     require(parse_yaml("").empty(), "empty document");
                   }});

  tests.push_back({"yaml_catalog_missing_command_fails_with_index", [] {
                     const auto parsed = catalog::parse_yaml_catalog("- command: ls\n"
                                                                     "- description: orphan\n");
                     require(!parsed.ok(), "record without command should fail");
                     require(assets::has_error_code(parsed.error(), assets::AssetErrorCode::Format),
                             parsed.error());
                     require(parsed.error().find("record 1 (line 2)") != std::string::npos,
                             parsed.error());
                   }});

  tests.push_back({"yaml_catalog_rejects_bad_pipeline_and_tabs", [] {
                     require(!catalog::parse_yaml_catalog("- command: ls\n  pipeline: maybe\n").ok(),
                             "non-boolean pipeline");
                     require(catalog::parse_yaml_catalog("- command: ls\n  pipeline: yes\n").value()[0].pipeline,
                             "yes is true");
                     require(!catalog::parse_yaml_catalog("- command: ls\n\tdescription: x\n").ok(),
                             "tab indentation");
                     require(!catalog::parse_yaml_catalog("- command: ls\n  keywords: [a, b\n").ok(),
                             "unterminated flow list");
                   }});

  tests.push_back({"json_catalog_reads_array_and_object_forms", [] {
                     const auto array = catalog::parse_json_catalog(
                         R"([{"command": "ls", "keywords": ["list"], "pipeline": true},
                             {"command": "cd", "description": "Change dir", "platform": ["linux"]}])");
                     require(array.ok(), array.error());
                     require(array.value().size() == 2, "two records");
                     require(array.value()[0].keywords == Strings{"list"}, "keywords");
                     require(array.value()[0].pipeline, "pipeline");
                     require(array.value()[1].description == "Change dir", "description");

                     const auto object = catalog::parse_json_catalog(
                         R"({"version": 1, "commands": [{"command": "pwd"}]})");
                     require(object.ok() && object.value().size() == 1, "object form");
                   }});

  tests.push_back({"json_catalog_rejects_positional_gaps", [] {
                     const auto missing = catalog::parse_json_catalog(R"([{"command": "ls"}, {"x": 1}])");
                     require(!missing.ok(), "record without command should fail");
                     require(missing.error().find("record 1") != std::string::npos, missing.error());

                     const auto scalar = catalog::parse_json_catalog(R"([{"command": "ls"}, 3])");
                     require(!scalar.ok(), "non-object elements should fail");

                     require(!catalog::parse_json_catalog(R"([{"command": "ls"})").ok(),
                             "unterminated array");
                   }});

  tests.push_back({"detect_format_uses_extension_then_content", [] {
                     require(catalog::detect_format("a.json", "- x") == catalog::CatalogFormat::Json,
                             "json extension");
                     require(catalog::detect_format("a.YAML", "[]") == catalog::CatalogFormat::Yaml,
                             "yaml extension");
                     require(catalog::detect_format("a.txt", "  [") == catalog::CatalogFormat::Json,
                             "sniffed json");
                     require(catalog::detect_format("a", "- command: ls") == catalog::CatalogFormat::Yaml,
                             "sniffed yaml");
                   }});

  tests.push_back({"load_catalog_missing_file_is_missing_input", [] {
                     cmdvec::testing::TempWorkspace workspace;
                     const auto loaded = catalog::load_catalog(workspace.path() / "commands.yml");
                     require(assets::has_error_code(loaded.error(), assets::AssetErrorCode::MissingInput),
                             loaded.error());
                   }});

  tests.push_back({"load_catalog_prefixes_errors_with_path", [] {
                     cmdvec::testing::TempWorkspace workspace;
                     workspace.create_file("commands.json", R"([{"description": "x"}])");
                     const auto loaded = catalog::load_catalog(workspace.path() / "commands.json");
                     require(!loaded.ok(), "invalid catalog should fail");
                     require(loaded.error().find("commands.json") != std::string::npos, loaded.error());
                   }});
}
