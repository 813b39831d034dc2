//src/evaluator/Environment.cpp
#include "evaluator.hpp"

// ----------------- Environment methods -----------------

std::string not_found_message(const std::string& name) {
   return "Variable '" + name + "' not found. Have you tried looking under the couch?";
}

const Value* Environment::find_slot(const std::string& name) const {
   const Environment* env = this;
   while (env) {
      auto it = env->values.find(name);
      if (it != env->values.end()) return &it->second;
      env = env->parent.get();
   }
   return nullptr;
}

bool Environment::has(const std::string& name) const {
   return find_slot(name) != nullptr;
}

Value Environment::lookup(const std::string& name) const {
   const Value* slot = find_slot(name);
   if (!slot) throw ChaosError(ErrorKind::NameNotFound, not_found_message(name));
   return *slot;
}

Value Environment::lookup(const std::string& name, const Token& at) const {
   const Value* slot = find_slot(name);
   if (!slot) throw ChaosError(ErrorKind::NameNotFound, not_found_message(name), at.loc);
   return *slot;
}

void Environment::define(const std::string& name, const Value& value) {
   // Redeclaration in the same scope replaces; outer scopes are untouched.
   values[name] = value;
}

void Environment::assign(const std::string& name, const Value& value, const Token& at) {
   Environment* env = this;
   while (env) {
      auto it = env->values.find(name);
      if (it != env->values.end()) {
         it->second = value;
         return;
      }
      env = env->parent.get();
   }
   throw ChaosError(ErrorKind::NameNotFound, not_found_message(name), at.loc);
}

EnvPtr Environment::child_scope() {
   return std::make_shared<Environment>(shared_from_this());
}
