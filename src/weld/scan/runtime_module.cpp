#include "weld/scan/runtime_module.hpp"

#include <string_view>

namespace weld::scan {

namespace {

constexpr std::string_view kRuntimeSource = R"js(var __defProp = Object.defineProperty;
var __getOwnPropNames = Object.getOwnPropertyNames;
var __getProtoOf = Object.getPrototypeOf;
var __hasOwnProp = Object.prototype.hasOwnProperty;
var __commonJS = (cb, mod) => () => (mod || cb((mod = { exports: {} }).exports, mod), mod.exports);
var __esm = (fn, res) => () => (fn && (res = fn(fn = 0)), res);
var __export = (target, all) => {
  for (var name in all)
    __defProp(target, name, { get: all[name], enumerable: true });
};
var __copyProps = (to, from, except) => {
  if (from && typeof from === "object" || typeof from === "function")
    for (let key of __getOwnPropNames(from))
      if (!__hasOwnProp.call(to, key) && key !== except)
        __defProp(to, key, { get: () => from[key], enumerable: true });
  return to;
};
var __toESM = (mod, isNodeMode) => (mod != null && mod.__esModule && !isNodeMode ? mod : __copyProps(__defProp(mod != null ? Object.create(__getProtoOf(mod)) : {}, "default", { value: mod, enumerable: true }), mod));
var __toCommonJS = (mod) => __copyProps(__defProp({}, "__esModule", { value: true }), mod);
export { __commonJS, __esm, __export, __toESM, __toCommonJS };
)js";

}  // namespace

auto RuntimeSource() -> std::string_view {
  return kRuntimeSource;
}

}  // namespace weld::scan
