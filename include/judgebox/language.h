#ifndef INCLUDE_JUDGEBOX_LANGUAGE_H_
#define INCLUDE_JUDGEBOX_LANGUAGE_H_

#include <string>
#include <optional>

// name, display name, source file, container image, remote provider id
// remote id is empty for languages executed by the local/container runners
#define ENUM_LANGUAGE_ \
  X(JAVASCRIPT, "javascript", "JavaScript", "solution.js", "node:18-alpine", "") \
  X(PYTHON, "python", "Python", "solution.py", "python:3.11-alpine", "") \
  X(JAVA, "java", "Java", "Main.java", "", "java") \
  X(CPP, "cpp", "C++", "main.cpp", "", "cpp") \
  X(GO, "go", "Go", "main.go", "", "go") \
  X(CSHARP, "csharp", "C#", "Program.cs", "", "csharp")
enum class Language {
#define X(name, ...) name,
  ENUM_LANGUAGE_
#undef X
};

#define ENUM_EXECUTION_MODE_ \
  X(LOCAL, "local") \
  X(CONTAINER, "container") \
  X(AUTO, "auto")
enum class ExecutionMode {
#define X(name, str) name,
  ENUM_EXECUTION_MODE_
#undef X
};

const char* LanguageName(Language);
const char* LanguageDisplayName(Language);
const char* LanguageFileName(Language);
const char* LanguageImage(Language);
const char* LanguageRemoteId(Language);

// Accepts aliases ("js", "py", "c++", ...), case-insensitive
std::optional<Language> ParseLanguage(const std::string&);
// Same as ParseLanguage but throws ValidationError listing the allowed names
Language NormalizeLanguage(const std::string&);
std::string SupportedLanguageList();

// Languages with a local interpreter (process or container backend)
bool IsLocalLanguage(Language);
// Languages that can only run on the remote execution provider
bool IsRemoteLanguage(Language);

// Interpreter command on the host and its fallback alias; only for local languages
const char* InterpreterCommand(Language);
const char* InterpreterAlias(Language);
// Interpreter command inside the container image
const char* ContainerInterpreter(Language);

const char* ExecutionModeName(ExecutionMode);
std::optional<ExecutionMode> ParseExecutionMode(const std::string&);

#endif  // INCLUDE_JUDGEBOX_LANGUAGE_H_
