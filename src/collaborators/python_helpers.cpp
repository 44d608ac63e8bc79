#include "collaborators/python_helpers.hpp"

#include "core/fs_utils.hpp"

#include <array>
#include <utility>

namespace comfytest::collaborators {

namespace {

constexpr std::string_view kSiteCustomize = R"PY(import importlib.machinery
import os
import sys
import types

for _name in filter(None, os.environ.get("COMFY_TEST_MOCK_PACKAGES", "").split(",")):
    if _name not in sys.modules:
        _module = types.ModuleType(_name)
        _module.__spec__ = importlib.machinery.ModuleSpec(_name, None)
        _module.__path__ = []
        sys.modules[_name] = _module
)PY";

// Shared prologue: put the host and custom_nodes on sys.path and import the
// extension package named on the command line.
constexpr std::string_view kImportPrologue = R"PY(import importlib
import json
import sys
import traceback

comfyui_dir, custom_nodes_dir, package = sys.argv[1:4]
wanted = sys.argv[4:]
sys.path.insert(0, comfyui_dir)
sys.path.insert(0, custom_nodes_dir)

try:
    import folder_paths  # noqa: F401
    module = importlib.import_module(package)
except Exception as exc:
    print(json.dumps({"error": "failed to import %s: %s" % (package, exc),
                      "traceback": traceback.format_exc()}))
    sys.exit(1)

mappings = getattr(module, "NODE_CLASS_MAPPINGS", {})
)PY";

constexpr std::string_view kInspectBody = R"PY(
import ast
import inspect
import textwrap

try:
    from importlib import metadata
    distributions = metadata.packages_distributions()
except Exception:
    distributions = {}

root = package.split(".")[0]


def import_closure(name, found, seen):
    if name in seen:
        return
    seen.add(name)
    mod = sys.modules.get(name)
    path = getattr(mod, "__file__", None) or ""
    if not path.endswith(".py"):
        return
    try:
        with open(path, encoding="utf-8") as handle:
            tree = ast.parse(handle.read())
    except (OSError, SyntaxError, UnicodeDecodeError):
        return
    parent = name if hasattr(mod, "__path__") else name.rpartition(".")[0]
    for node in ast.walk(tree):
        targets = []
        if isinstance(node, ast.Import):
            targets = [alias.name for alias in node.names]
        elif isinstance(node, ast.ImportFrom):
            if node.level:
                parts = parent.split(".")
                base = ".".join(parts[:len(parts) - node.level + 1])
                targets = [base + "." + node.module if node.module else base]
            elif node.module:
                targets = [node.module]
        for target in targets:
            top = target.split(".")[0]
            if top == root:
                import_closure(target, found, seen)
                continue
            found.add(top)
            found.update(distributions.get(top, []))


def return_arity(fn):
    try:
        tree = ast.parse(textwrap.dedent(inspect.getsource(fn)))
    except (OSError, TypeError, SyntaxError):
        return None
    arities = set()
    for node in ast.walk(tree):
        if not isinstance(node, ast.Return) or node.value is None:
            continue
        value = node.value
        if isinstance(value, ast.Dict):
            value = next((v for k, v in zip(value.keys, value.values)
                          if isinstance(k, ast.Constant) and k.value == "result"), None)
        if isinstance(value, ast.Tuple):
            arities.add(len(value.elts))
    return arities.pop() if len(arities) == 1 else None


classes = {}
for name in wanted:
    cls = mappings.get(name)
    if cls is None:
        continue
    found = set()
    import_closure(getattr(cls, "__module__", ""), found, set())
    function = getattr(cls, "FUNCTION", None)
    target = getattr(cls, function, None) if isinstance(function, str) else None
    classes[name] = {
        "dependencies": sorted(found),
        "entry_point_resolved": callable(target),
        "return_arity": return_arity(target) if callable(target) else None,
    }

print(json.dumps({"classes": classes}))
)PY";

constexpr std::string_view kInstantiateBody = R"PY(
classes = {}
for name in wanted:
    cls = mappings.get(name)
    if cls is None:
        classes[name] = {"ok": False, "error": "not in NODE_CLASS_MAPPINGS"}
        continue
    try:
        cls()
        classes[name] = {"ok": True}
    except Exception as exc:
        classes[name] = {"ok": False, "error": str(exc), "traceback": traceback.format_exc()}

print(json.dumps({"classes": classes}))
)PY";

} // namespace

bool WriteHelperScripts(const std::filesystem::path& dir, std::string& error) {
  const std::array<std::pair<const char*, std::string>, 3> scripts = {{
      {kSiteCustomizeFileName, std::string(kSiteCustomize)},
      {kInspectScriptFileName, std::string(kImportPrologue) + std::string(kInspectBody)},
      {kInstantiateScriptFileName, std::string(kImportPrologue) + std::string(kInstantiateBody)},
  }};
  for (const auto& [file_name, text] : scripts) {
    if (!core::WriteTextFileAtomic(dir / file_name, text, error)) {
      return false;
    }
  }
  return true;
}

bool ParseHelperOutput(std::string_view output, core::json::Value& root, std::string& error) {
  std::string_view last;
  std::size_t start = 0;
  while (start < output.size()) {
    std::size_t end = output.find('\n', start);
    if (end == std::string_view::npos) {
      end = output.size();
    }
    std::string_view line = output.substr(start, end - start);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
      line.remove_suffix(1);
    }
    if (!line.empty() && line.front() == '{') {
      last = line;
    }
    start = end + 1;
  }
  if (last.empty()) {
    error = "helper printed no JSON result";
    return false;
  }
  if (!core::json::Parse(last, root, error)) {
    error = "helper result is not valid JSON: " + error;
    return false;
  }
  if (!root.IsObject()) {
    error = "helper result must be a JSON object";
    return false;
  }
  return true;
}

} // namespace comfytest::collaborators
