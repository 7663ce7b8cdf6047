#include "judgebox/language.h"

#include <utility>

#include "judgebox/errors.h"
#include "judgebox/utils.h"

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;
#define X_RETURN_ARG4(cls, x, y, z, w, ...) case cls::x: return w;
#define X_RETURN_ARG5(cls, x, y, z, w, v, ...) case cls::x: return v;
#define X_RETURN_ARG6(cls, x, y, z, w, v, u, ...) case cls::x: return u;

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG3(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageDisplayName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG4(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageFileName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG5(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageImage, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG6(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageRemoteId, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG2(ExecutionMode, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecutionModeName, ExecutionMode, ENUM_EXECUTION_MODE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3
#undef X_RETURN_ARG4
#undef X_RETURN_ARG5
#undef X_RETURN_ARG6

namespace {

const std::pair<const char*, Language> kLanguageAliases[] = {
  {"js", Language::JAVASCRIPT},
  {"node", Language::JAVASCRIPT},
  {"nodejs", Language::JAVASCRIPT},
  {"javascript", Language::JAVASCRIPT},
  {"py", Language::PYTHON},
  {"python", Language::PYTHON},
  {"python3", Language::PYTHON},
  {"java", Language::JAVA},
  {"cpp", Language::CPP},
  {"c++", Language::CPP},
  {"cc", Language::CPP},
  {"cplusplus", Language::CPP},
  {"go", Language::GO},
  {"golang", Language::GO},
  {"csharp", Language::CSHARP},
  {"cs", Language::CSHARP},
  {"c#", Language::CSHARP},
};

} // namespace

std::optional<Language> ParseLanguage(const std::string& str) {
  std::string key = ToLower(Trim(str));
  for (auto& [alias, lang] : kLanguageAliases) {
    if (key == alias) return lang;
  }
  return std::nullopt;
}

std::string SupportedLanguageList() {
  std::string ret;
#define X(name, str, ...) ret += ret.empty() ? str : ", " str;
  ENUM_LANGUAGE_
#undef X
  return ret;
}

Language NormalizeLanguage(const std::string& str) {
  if (auto lang = ParseLanguage(str)) return *lang;
  throw ValidationError("Unsupported language \"" + str + "\". Allowed: " + SupportedLanguageList());
}

bool IsLocalLanguage(Language lang) {
  return !IsRemoteLanguage(lang);
}

bool IsRemoteLanguage(Language lang) {
  return LanguageRemoteId(lang)[0] != '\0';
}

const char* InterpreterCommand(Language lang) {
  switch (lang) {
    case Language::JAVASCRIPT: return "node";
    case Language::PYTHON: return "python3";
    default: return "";
  }
}

const char* InterpreterAlias(Language lang) {
  switch (lang) {
    case Language::JAVASCRIPT: return "nodejs";
    case Language::PYTHON: return "python";
    default: return "";
  }
}

const char* ContainerInterpreter(Language lang) {
  switch (lang) {
    case Language::JAVASCRIPT: return "node";
    case Language::PYTHON: return "python";
    default: return "";
  }
}

std::optional<ExecutionMode> ParseExecutionMode(const std::string& str) {
  std::string key = ToLower(Trim(str));
#define X(name, s) if (key == s) return ExecutionMode::name;
  ENUM_EXECUTION_MODE_
#undef X
  return std::nullopt;
}
